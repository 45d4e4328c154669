#include <catch2/catch_test_macros.hpp>

#include "poll_tracker.hpp"

#include <chrono>

using namespace std::chrono_literals;

namespace {

ProcessStat sample(char state, uint64_t cpu) {
    return ProcessStat{.state = state, .utime = cpu, .stime = 0, .start_ticks = 0};
}

} // namespace

TEST_CASE("PollTracker", "[poll_tracker]") {
    auto t0 = std::chrono::steady_clock::time_point{} + 1000s;
    PollTracker tracker(42, t0);

    SECTION("FirstPollHasNoPreviousSample") {
        auto ctx = tracker.advance(sample('S', 100), t0);
        REQUIRE(ctx.pid == 42);
        REQUIRE_FALSE(ctx.last_cpu_time.has_value());
        REQUIRE(ctx.idle_duration == 0ms);
        REQUIRE(tracker.last_cpu_time() == 100u);
    }

    SECTION("IdleGrowsWhileNothingChanges") {
        tracker.advance(sample('S', 100), t0);
        auto ctx = tracker.advance(sample('S', 100), t0 + 2s);
        REQUIRE(ctx.last_cpu_time == 100u);
        REQUIRE(ctx.idle_duration == 2s);

        ctx = tracker.advance(sample('S', 100), t0 + 7s);
        REQUIRE(ctx.idle_duration == 7s);
    }

    SECTION("CpuProgressResetsIdle") {
        tracker.advance(sample('S', 100), t0);
        tracker.advance(sample('S', 100), t0 + 5s);
        auto ctx = tracker.advance(sample('S', 105), t0 + 6s);
        REQUIRE(ctx.last_cpu_time == 100u);
        REQUIRE(ctx.idle_duration == 0ms);

        ctx = tracker.advance(sample('S', 105), t0 + 9s);
        REQUIRE(ctx.last_cpu_time == 105u);
        REQUIRE(ctx.idle_duration == 3s);
    }

    SECTION("StateChangeResetsIdle") {
        tracker.advance(sample('S', 100), t0);
        auto ctx = tracker.advance(sample('R', 100), t0 + 4s);
        REQUIRE(ctx.idle_duration == 0ms);
    }

    SECTION("FailedReadKeepsHistory") {
        tracker.advance(sample('S', 100), t0);
        auto ctx = tracker.advance(std::unexpected(ProbeError::Unreadable), t0 + 3s);
        REQUIRE(ctx.last_cpu_time == 100u);
        REQUIRE(ctx.idle_duration == 3s);
        REQUIRE(tracker.last_cpu_time() == 100u);
    }

    SECTION("LastCheckIsPreviousWallTime") {
        auto wall = std::chrono::system_clock::time_point{} + 5000s;
        tracker.advance(sample('S', 1), t0, wall);
        auto ctx = tracker.advance(sample('S', 1), t0 + 2s, wall + 2s);
        REQUIRE(ctx.last_check == wall);
    }
}
