/************************************************************************\

    Tandem - Dual-pane terminal file manager
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "FormatUtils.h"

namespace {

struct ByteUnits {
    static constexpr quint64 kilo = 1024;
    static constexpr quint64 mega = kilo * 1024;
    static constexpr quint64 giga = mega * 1024;
    static constexpr quint64 tera = giga * 1024;
};

QString formatWithUnit(quint64 bytes, bool longSuffix)
{
    struct Unit {
        quint64 size;
        const char *longName;
        const char *shortName;
    };
    static const Unit units[] = {
        {ByteUnits::tera, "TB", "T"},
        {ByteUnits::giga, "GB", "G"},
        {ByteUnits::mega, "MB", "M"},
        {ByteUnits::kilo, "KB", "K"},
    };

    for (const Unit &unit : units) {
        if (bytes >= unit.size) {
            const double value = static_cast<double>(bytes) / static_cast<double>(unit.size);
            return QString::number(value, 'f', 1) + QLatin1String(longSuffix ? unit.longName : unit.shortName);
        }
    }
    return longSuffix ? QString::number(bytes) + QLatin1Char('B') : QString::number(bytes);
}

} // namespace

namespace FormatUtils {

/**
 * @brief Formats a byte count for status lines, e.g. "1.5GB" or "250KB".
 */
QString formatBytes(quint64 bytes)
{
    return formatWithUnit(bytes, true);
}

/**
 * @brief Formats a byte count for narrow size columns, e.g. "1.5G" or "250K".
 */
QString formatSize(quint64 bytes)
{
    return formatWithUnit(bytes, false);
}

} // namespace FormatUtils
