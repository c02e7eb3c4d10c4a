// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <hoist/core/rate_controller.hpp>

using namespace hoist::core;
using namespace std::chrono_literals;

TEST_CASE("RateController::rate", "[rate]") {
    UploadTracker tracker;

    SECTION("Zero before any time has passed") {
        tracker.bytes_uploaded = 1'000'000;
        CHECK(RateController::rate(tracker, tracker.start_time) == 0.0);
    }

    SECTION("Bytes over elapsed seconds") {
        tracker.bytes_uploaded = 4'000'000;
        auto rate = RateController::rate(tracker, tracker.start_time + 2s);
        CHECK(rate == Catch::Approx(2'000'000.0));
    }

    SECTION("Clock behind start counts as no elapsed time") {
        tracker.bytes_uploaded = 10;
        CHECK(RateController::rate(tracker, tracker.start_time - 1s) == 0.0);
    }
}

TEST_CASE("RateController::should_admit", "[rate]") {
    RateController controller(3, 1'000'000.0);  // 3 slots, 1 MB/s
    UploadTracker tracker;
    const auto later = tracker.start_time + 1s;

    SECTION("Under target with free slots") {
        tracker.bytes_uploaded = 500'000;
        tracker.active_uploads = 1;
        CHECK(controller.should_admit(tracker, later));
    }

    SECTION("Over target with work in flight") {
        tracker.bytes_uploaded = 5'000'000;
        tracker.active_uploads = 1;
        CHECK_FALSE(controller.should_admit(tracker, later));
    }

    SECTION("Over target but idle still admits") {
        tracker.bytes_uploaded = 5'000'000;
        tracker.active_uploads = 0;
        CHECK(controller.should_admit(tracker, later));
    }

    SECTION("Full never admits") {
        tracker.bytes_uploaded = 0;
        tracker.active_uploads = 3;
        CHECK_FALSE(controller.should_admit(tracker, later));
    }

    SECTION("Exactly at target does not admit more") {
        tracker.bytes_uploaded = 1'000'000;
        tracker.active_uploads = 1;
        CHECK_FALSE(controller.should_admit(tracker, later));
    }
}

TEST_CASE("RateController::pacing_delay", "[rate]") {
    RateController controller(4, 1'000'000.0);
    UploadTracker tracker;
    const auto later = tracker.start_time + 1s;

    SECTION("Short interval under target") {
        tracker.bytes_uploaded = 100;
        CHECK(controller.pacing_delay(tracker, later) == PACING_UNDER_TARGET);
    }

    SECTION("Long interval over target") {
        tracker.bytes_uploaded = 2'000'000;
        CHECK(controller.pacing_delay(tracker, later) == PACING_OVER_TARGET);
    }

    SECTION("Custom intervals") {
        RateController custom(4, 1'000'000.0, 1ms, 7ms);
        tracker.bytes_uploaded = 2'000'000;
        CHECK(custom.pacing_delay(tracker, later) == 7ms);
        tracker.bytes_uploaded = 0;
        CHECK(custom.pacing_delay(tracker, later) == 1ms);
    }
}

TEST_CASE("RateController accessors", "[rate]") {
    RateController controller(8, 4.0 * MIB);
    CHECK(controller.max_concurrent() == 8);
    CHECK(controller.target_rate() == Catch::Approx(4.0 * 1024 * 1024));
}
