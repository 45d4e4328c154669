#pragma once

#include "detectors/detector.hpp"
#include "platform/process_stat_reader.hpp"

#include <chrono>
#include <memory>

struct StallThresholds {
    std::chrono::seconds timeout{600};
    std::chrono::seconds min_task_age{30};
};

// Flags a process whose CPU time has not moved since the previous poll and
// whose idle period exceeds the timeout. A fresh process shows no CPU delta
// on its first polls, hence the task age gate.
class StallDetector : public AttentionDetector {
public:
    StallDetector(std::shared_ptr<const ProcessStatReader> stat_reader,
                  StallThresholds thresholds = {});

    std::string_view name() const override { return "stall"; }
    std::optional<AttentionReason> check(const Task& task, const PollContext& ctx) const override;

    // check() against an explicit wall-clock time.
    std::optional<AttentionReason> check_at(const Task& task, const PollContext& ctx,
                                            std::chrono::system_clock::time_point now) const;

    std::chrono::seconds timeout() const { return thresholds_.timeout; }
    const StallThresholds& thresholds() const { return thresholds_; }

private:
    std::shared_ptr<const ProcessStatReader> stat_reader_;
    StallThresholds thresholds_;
};
