#pragma once

#include "detectors/detector.hpp"
#include "platform/stdin_probe.hpp"

#include <chrono>
#include <memory>

struct StdinThresholds {
    std::chrono::seconds min_task_age{30};
};

// Flags a task old enough that still has descriptor 0 open for reading,
// as reported by an external tool. Not in the default set: each check
// spawns a process.
class StdinDetector : public AttentionDetector {
public:
    explicit StdinDetector(std::shared_ptr<const StdinProbe> probe,
                           StdinThresholds thresholds = {});

    std::string_view name() const override { return "stdin"; }
    std::optional<AttentionReason> check(const Task& task, const PollContext& ctx) const override;

    // check() against an explicit wall-clock time.
    std::optional<AttentionReason> check_at(const Task& task, const PollContext& ctx,
                                            std::chrono::system_clock::time_point now) const;

private:
    std::shared_ptr<const StdinProbe> probe_;
    StdinThresholds thresholds_;
};
