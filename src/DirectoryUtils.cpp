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

#include "DirectoryUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QDirIterator>
#include <QFileInfo>

#include <algorithm>

namespace {

struct SizeModeNames {
    static constexpr char none[] = "none";
    static constexpr char quick[] = "quick";
    static constexpr char full[] = "full";
};

} // namespace

namespace DirectoryUtils {

const QString parentEntryName = QStringLiteral("..");

/**
 * @brief Lists one folder, applying the hidden file rule and the pane sort order.
 * @param path Folder to list.
 * @param showHidden True to include names starting with a dot.
 * @param sizeMode Quick and Full fill in file sizes.
 * @param entries Receives the entries, with ".." first when the folder has a parent.
 * @param error Optional output error message.
 * @return True when the folder could be read.
 */
bool listEntries(const QString &path,
                 bool showHidden,
                 SizeDisplayMode sizeMode,
                 QVector<Entry> *entries,
                 QString *error)
{
    const QFileInfo folderInfo(path);
    if (!folderInfo.exists()) {
        if (error) {
            *error = QCoreApplication::translate("DirectoryUtils", "Cannot open directory: %1 does not exist").arg(path);
        }
        return false;
    }
    if (!folderInfo.isDir()) {
        if (error) {
            *error = QCoreApplication::translate("DirectoryUtils", "Cannot open directory: %1 is not a directory").arg(path);
        }
        return false;
    }
    if (!folderInfo.isReadable() || !folderInfo.isExecutable()) {
        if (error) {
            *error = QCoreApplication::translate("DirectoryUtils", "Permission denied");
        }
        return false;
    }

    QDir::Filters filters = QDir::AllEntries | QDir::System | QDir::NoDotAndDotDot;
    if (showHidden) {
        filters |= QDir::Hidden;
    }
    const QDir dir(path);
    const QFileInfoList infos = dir.entryInfoList(filters, QDir::NoSort);

    QVector<Entry> listed;
    listed.reserve(infos.size());
    for (const QFileInfo &info : infos) {
        if (!showHidden && info.fileName().startsWith(QLatin1Char('.'))) {
            continue;
        }
        Entry entry;
        entry.name = info.fileName();
        entry.path = info.absoluteFilePath();
        entry.isDir = info.isDir();
        if (!entry.isDir && sizeMode != SizeDisplayMode::None) {
            entry.hasSize = true;
            entry.size = static_cast<quint64>(qMax<qint64>(info.size(), 0));
        }
        listed.append(entry);
    }
    sortEntries(listed);

    entries->clear();
    QDir parent(dir.absolutePath());
    if (parent.cdUp()) {
        Entry up;
        up.name = parentEntryName;
        up.path = parent.absolutePath();
        up.isDir = true;
        entries->append(up);
    }
    entries->append(listed);
    return true;
}

/**
 * @brief Sorts folders before files, then by case-insensitive name.
 * @param entries Entries to sort in place.
 */
void sortEntries(QVector<Entry> &entries)
{
    std::sort(entries.begin(), entries.end(), [](const Entry &left, const Entry &right) {
        if (left.isDir != right.isDir) {
            return left.isDir;
        }
        return left.name.toLower() < right.name.toLower();
    });
}

/**
 * @brief Sums the size of every regular file below a folder without following links.
 * @param path Folder to measure.
 * @param isCancelled Optional predicate checked between entries.
 * @return Total size in bytes, partial when cancelled.
 */
quint64 directorySize(const QString &path, const std::function<bool()> &isCancelled)
{
    quint64 total = 0;
    QDirIterator it(path,
                    QDir::Files | QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        if (isCancelled && isCancelled()) {
            break;
        }
        it.next();
        const QFileInfo info = it.fileInfo();
        if (info.isFile()) {
            total += static_cast<quint64>(info.size());
        }
    }
    return total;
}

QString sizeModeName(SizeDisplayMode mode)
{
    switch (mode) {
    case SizeDisplayMode::None:
        return QLatin1String(SizeModeNames::none);
    case SizeDisplayMode::Quick:
        return QLatin1String(SizeModeNames::quick);
    case SizeDisplayMode::Full:
        return QLatin1String(SizeModeNames::full);
    }
    return QLatin1String(SizeModeNames::none);
}

bool parseSizeMode(const QString &name, SizeDisplayMode *mode)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String(SizeModeNames::none)) {
        *mode = SizeDisplayMode::None;
    } else if (key == QLatin1String(SizeModeNames::quick)) {
        *mode = SizeDisplayMode::Quick;
    } else if (key == QLatin1String(SizeModeNames::full)) {
        *mode = SizeDisplayMode::Full;
    } else {
        return false;
    }
    return true;
}

} // namespace DirectoryUtils
