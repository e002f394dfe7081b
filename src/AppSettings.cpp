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

#include "AppSettings.h"

#include <QDir>
#include <QSettings>

#include "Logging.h"

namespace {
constexpr char jobsGroup[] = "jobs";
constexpr char uiGroup[] = "ui";
constexpr char panesGroup[] = "panes";

constexpr char copyBufferSizeKey[] = "copyBufferSize";
constexpr char pausePollKey[] = "pausePollMs";
constexpr char visibilityThresholdKey[] = "visibilityThresholdMs";
constexpr char throughputSampleKey[] = "throughputSampleMs";
constexpr char throughputHistoryKey[] = "throughputHistory";
constexpr char eventPollKey[] = "eventPollMs";
constexpr char renameDialogTimeoutKey[] = "renameDialogTimeoutMs";
constexpr char errorDisplayKey[] = "errorDisplayMs";
constexpr char pageSizeKey[] = "pageSize";
constexpr char showHiddenKey[] = "showHidden";
constexpr char sizeModeKey[] = "sizeMode";
constexpr char rightPathKey[] = "rightPath";

int positiveValue(const QSettings &settings, const char *key, int fallback)
{
    bool ok = false;
    const int value = settings.value(QLatin1String(key), fallback).toInt(&ok);
    if (!ok || value <= 0) {
        qCWarning(lcApp) << "ignoring invalid setting" << key << settings.value(QLatin1String(key));
        return fallback;
    }
    return value;
}
} // namespace

AppSettings AppSettings::load()
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Tandem", "Tandem");
    return fromSettings(settings);
}

/**
 * @brief Reads every option, keeping defaults for missing or invalid values.
 * @param settings Settings store to read from.
 * @return Populated settings.
 */
AppSettings AppSettings::fromSettings(QSettings &settings)
{
    AppSettings result;

    settings.beginGroup(QLatin1String(jobsGroup));
    result.copyBufferSize = positiveValue(settings, copyBufferSizeKey, result.copyBufferSize);
    result.pausePollMs = positiveValue(settings, pausePollKey, result.pausePollMs);
    result.visibilityThresholdMs = positiveValue(settings, visibilityThresholdKey, result.visibilityThresholdMs);
    result.throughputSampleMs = positiveValue(settings, throughputSampleKey, result.throughputSampleMs);
    result.throughputHistory = positiveValue(settings, throughputHistoryKey, result.throughputHistory);
    settings.endGroup();

    settings.beginGroup(QLatin1String(uiGroup));
    result.eventPollMs = positiveValue(settings, eventPollKey, result.eventPollMs);
    result.renameDialogTimeoutMs = positiveValue(settings, renameDialogTimeoutKey, result.renameDialogTimeoutMs);
    result.errorDisplayMs = positiveValue(settings, errorDisplayKey, result.errorDisplayMs);
    result.pageSize = positiveValue(settings, pageSizeKey, result.pageSize);
    result.showHidden = settings.value(QLatin1String(showHiddenKey), result.showHidden).toBool();
    const QString sizeModeName = settings.value(QLatin1String(sizeModeKey)).toString();
    if (!sizeModeName.isEmpty() && !DirectoryUtils::parseSizeMode(sizeModeName, &result.sizeMode)) {
        qCWarning(lcApp) << "ignoring invalid size mode" << sizeModeName;
    }
    settings.endGroup();

    settings.beginGroup(QLatin1String(panesGroup));
    const QString storedPath = settings.value(QLatin1String(rightPathKey)).toString();
    if (!storedPath.isEmpty() && QDir(storedPath).exists()) {
        result.rightPanePath = storedPath;
    }
    settings.endGroup();

    return result;
}

void AppSettings::saveRightPanePath(const QString &path)
{
    QSettings settings(QSettings::IniFormat, QSettings::UserScope, "Tandem", "Tandem");
    saveRightPanePath(settings, path);
}

void AppSettings::saveRightPanePath(QSettings &settings, const QString &path)
{
    settings.beginGroup(QLatin1String(panesGroup));
    settings.setValue(QLatin1String(rightPathKey), path);
    settings.endGroup();
    settings.sync();
}
