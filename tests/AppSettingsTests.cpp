#include <catch2/catch_test_macros.hpp>

#include <QSettings>
#include <QTemporaryDir>

#include "AppSettings.h"

namespace app_settings {

TEST_CASE("Missing settings fall back to defaults", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("tandem.ini")), QSettings::IniFormat);

    const AppSettings loaded = AppSettings::fromSettings(settings);
    const AppSettings defaults;
    CHECK(loaded.copyBufferSize == defaults.copyBufferSize);
    CHECK(loaded.visibilityThresholdMs == 500);
    CHECK(loaded.throughputSampleMs == 200);
    CHECK(loaded.throughputHistory == 60);
    CHECK(loaded.eventPollMs == 50);
    CHECK(loaded.renameDialogTimeoutMs == 4000);
    CHECK(loaded.sizeMode == SizeDisplayMode::None);
    CHECK_FALSE(loaded.showHidden);
    CHECK(loaded.rightPanePath.isEmpty());
}

TEST_CASE("Stored settings are read back", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("tandem.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("jobs/copyBufferSize"), 8192);
    settings.setValue(QStringLiteral("jobs/visibilityThresholdMs"), 250);
    settings.setValue(QStringLiteral("ui/showHidden"), true);
    settings.setValue(QStringLiteral("ui/sizeMode"), QStringLiteral("full"));
    AppSettings::saveRightPanePath(settings, dir.path());

    const AppSettings loaded = AppSettings::fromSettings(settings);
    CHECK(loaded.copyBufferSize == 8192);
    CHECK(loaded.visibilityThresholdMs == 250);
    CHECK(loaded.showHidden);
    CHECK(loaded.sizeMode == SizeDisplayMode::Full);
    CHECK(loaded.rightPanePath == dir.path());
}

TEST_CASE("Invalid values keep the defaults", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("tandem.ini")), QSettings::IniFormat);
    settings.setValue(QStringLiteral("jobs/pausePollMs"), -5);
    settings.setValue(QStringLiteral("jobs/throughputHistory"), QStringLiteral("many"));
    settings.setValue(QStringLiteral("ui/sizeMode"), QStringLiteral("huge"));
    settings.setValue(QStringLiteral("panes/rightPath"), dir.filePath(QStringLiteral("missing")));

    const AppSettings loaded = AppSettings::fromSettings(settings);
    CHECK(loaded.pausePollMs == 100);
    CHECK(loaded.throughputHistory == 60);
    CHECK(loaded.sizeMode == SizeDisplayMode::None);
    CHECK(loaded.rightPanePath.isEmpty());
}

} // namespace app_settings
