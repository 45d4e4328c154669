#pragma once

#include "platform/process_stat_reader.hpp"
#include "poll_context.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>

// Carries the state that must survive between polls of one process: the
// previous CPU sample and the instant activity was last seen. Detectors stay
// stateless; this lives with the caller.
class PollTracker {
public:
    using SteadyTime = std::chrono::steady_clock::time_point;

    PollTracker(int pid, SteadyTime start);

    // Build the context for this poll from a fresh sample. Idle time resets
    // when CPU time or the state code changed since the previous sample; a
    // failed read leaves the history untouched.
    PollContext advance(const std::expected<ProcessStat, ProbeError>& sample, SteadyTime now,
                        std::chrono::system_clock::time_point wall_now = std::chrono::system_clock::now());

    std::optional<uint64_t> last_cpu_time() const { return last_cpu_; }

private:
    int pid_;
    std::optional<uint64_t> last_cpu_;
    char last_state_ = '\0';
    SteadyTime last_activity_;
    std::chrono::system_clock::time_point last_check_;
};
