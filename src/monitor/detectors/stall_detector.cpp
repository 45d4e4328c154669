#include "detectors/stall_detector.hpp"

StallDetector::StallDetector(std::shared_ptr<const ProcessStatReader> stat_reader,
                             StallThresholds thresholds)
    : stat_reader_(std::move(stat_reader)), thresholds_(thresholds) {}

std::optional<AttentionReason> StallDetector::check(const Task& task,
                                                    const PollContext& ctx) const {
    return check_at(task, ctx, std::chrono::system_clock::now());
}

std::optional<AttentionReason> StallDetector::check_at(
    const Task& task, const PollContext& ctx, std::chrono::system_clock::time_point now) const {
    if (!ctx.last_cpu_time) return std::nullopt;

    auto stat = stat_reader_->read(ctx.pid);
    if (!stat) return std::nullopt;

    if (stat->cpu_time() != *ctx.last_cpu_time) return std::nullopt;
    if (ctx.idle_duration <= thresholds_.timeout) return std::nullopt;

    if (task_age(task, now) > thresholds_.min_task_age) {
        return ProcessStalled{};
    }
    return std::nullopt;
}
