#include <catch2/catch_test_macros.hpp>

#include "FormatUtils.h"

namespace format_utils {

TEST_CASE("Status line byte counts", "[format]") {
    CHECK(FormatUtils::formatBytes(0) == QStringLiteral("0B"));
    CHECK(FormatUtils::formatBytes(512) == QStringLiteral("512B"));
    CHECK(FormatUtils::formatBytes(1536) == QStringLiteral("1.5KB"));
    CHECK(FormatUtils::formatBytes(1024ull * 1024) == QStringLiteral("1.0MB"));
    CHECK(FormatUtils::formatBytes(3ull * 1024 * 1024 * 1024) == QStringLiteral("3.0GB"));
}

TEST_CASE("Size column byte counts", "[format]") {
    CHECK(FormatUtils::formatSize(0) == QStringLiteral("0"));
    CHECK(FormatUtils::formatSize(1023) == QStringLiteral("1023"));
    CHECK(FormatUtils::formatSize(1024) == QStringLiteral("1.0K"));
    CHECK(FormatUtils::formatSize(5ull * 1024 * 1024 * 1024 * 1024) == QStringLiteral("5.0T"));
}

} // namespace format_utils
