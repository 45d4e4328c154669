#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

// Snapshot built by the polling caller before each round of checks.
struct PollContext {
    int pid = 0;
    std::chrono::system_clock::time_point last_check;
    std::optional<uint64_t> last_cpu_time;  // utime + stime from the previous poll
    std::chrono::milliseconds idle_duration{0};
};
