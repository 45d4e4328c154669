#include "detectors/process_state_detector.hpp"

ProcessStateDetector::ProcessStateDetector(std::shared_ptr<const ProcessStatReader> stat_reader,
                                           std::shared_ptr<const FdProbe> fd_probe,
                                           ProcessStateThresholds thresholds)
    : stat_reader_(std::move(stat_reader)), fd_probe_(std::move(fd_probe)),
      thresholds_(thresholds) {}

bool ProcessStateDetector::sleeping_on_terminal(int pid) const {
    auto stat = stat_reader_->read(pid);
    if (!stat || stat->state != 'S') return false;

    auto target = fd_probe_->resolve(pid, 0);
    if (!target) return false;
    return is_interactive_terminal(*target);
}

std::optional<AttentionReason> ProcessStateDetector::check(const Task& task,
                                                           const PollContext& ctx) const {
    return check_at(task, ctx, std::chrono::system_clock::now());
}

std::optional<AttentionReason> ProcessStateDetector::check_at(
    const Task& task, const PollContext& ctx, std::chrono::system_clock::time_point now) const {
    if (!sleeping_on_terminal(ctx.pid)) return std::nullopt;

    auto age = task_age(task, now);
    auto idle = std::chrono::duration_cast<std::chrono::seconds>(ctx.idle_duration);
    if (age > thresholds_.min_task_age && idle > thresholds_.min_idle) {
        return WaitingForInput{};
    }
    return std::nullopt;
}
