#pragma once

#include <QString>

#include "DirectoryUtils.h"

class QSettings;

struct AppSettings {
    int copyBufferSize = 64 * 1024;
    int pausePollMs = 100;
    int visibilityThresholdMs = 500;
    int throughputSampleMs = 200;
    int throughputHistory = 60;
    int eventPollMs = 50;
    int renameDialogTimeoutMs = 4000;
    int errorDisplayMs = 3000;
    int pageSize = 10;
    bool showHidden = false;
    SizeDisplayMode sizeMode = SizeDisplayMode::None;
    QString rightPanePath;

    static AppSettings load();
    static AppSettings fromSettings(QSettings &settings);
    static void saveRightPanePath(const QString &path);
    static void saveRightPanePath(QSettings &settings, const QString &path);
};
