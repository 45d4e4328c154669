#include "poll_tracker.hpp"

PollTracker::PollTracker(int pid, SteadyTime start)
    : pid_(pid), last_activity_(start) {}

PollContext PollTracker::advance(const std::expected<ProcessStat, ProbeError>& sample,
                                 SteadyTime now, std::chrono::system_clock::time_point wall_now) {
    PollContext ctx;
    ctx.pid = pid_;
    ctx.last_check = last_check_;
    ctx.last_cpu_time = last_cpu_;

    if (sample) {
        bool changed = !last_cpu_ || *last_cpu_ != sample->cpu_time() ||
                       last_state_ != sample->state;
        if (changed) last_activity_ = now;
        last_cpu_ = sample->cpu_time();
        last_state_ = sample->state;
    }

    if (now > last_activity_) {
        ctx.idle_duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_activity_);
    }
    last_check_ = wall_now;
    return ctx;
}
