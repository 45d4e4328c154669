#include "detectors/stdin_detector.hpp"

StdinDetector::StdinDetector(std::shared_ptr<const StdinProbe> probe, StdinThresholds thresholds)
    : probe_(std::move(probe)), thresholds_(thresholds) {}

std::optional<AttentionReason> StdinDetector::check(const Task& task,
                                                    const PollContext& ctx) const {
    return check_at(task, ctx, std::chrono::system_clock::now());
}

std::optional<AttentionReason> StdinDetector::check_at(
    const Task& task, const PollContext& ctx, std::chrono::system_clock::time_point now) const {
    // Age first: it is free, the probe spawns a process
    if (task_age(task, now) <= thresholds_.min_task_age) {
        return std::nullopt;
    }
    if (!probe_->reading_stdin(ctx.pid)) return std::nullopt;
    return WaitingForInput{};
}
