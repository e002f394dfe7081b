#include <catch2/catch_test_macros.hpp>

#include "ThroughputTracker.h"

namespace throughput_tracker {

TEST_CASE("Samples are only taken once the interval elapsed", "[throughput]") {
    ThroughputTracker tracker(0, 60, 200);

    tracker.update(1000, 100);
    CHECK(tracker.history().isEmpty());
    CHECK(tracker.currentThroughput() == 0);

    tracker.update(1000, 200);
    REQUIRE(tracker.history().size() == 1);
    CHECK(tracker.currentThroughput() == 5000);

    SECTION("rate is relative to the previous sample") {
        tracker.update(3000, 600);
        CHECK(tracker.currentThroughput() == 5000);
        CHECK(tracker.history().size() == 2);
    }

    SECTION("a falling counter yields a zero rate") {
        tracker.update(500, 400);
        CHECK(tracker.currentThroughput() == 0);
    }
}

TEST_CASE("History keeps the newest samples up to its size", "[throughput]") {
    ThroughputTracker tracker(0, 60, 200);

    quint64 bytes = 0;
    for (int i = 1; i <= 70; ++i) {
        bytes += static_cast<quint64>(i) * 200;
        tracker.update(bytes, static_cast<qint64>(i) * 200);
    }

    REQUIRE(tracker.history().size() == 60);
    CHECK(tracker.historySize() == 60);
    CHECK(tracker.history().first() == 11000);
    CHECK(tracker.history().last() == 70000);
    CHECK(tracker.currentThroughput() == 70000);
}

TEST_CASE("History size is at least one sample", "[throughput]") {
    ThroughputTracker tracker(0, 0, 10);
    tracker.update(100, 10);
    tracker.update(200, 20);
    CHECK(tracker.history().size() == 1);
}

} // namespace throughput_tracker
