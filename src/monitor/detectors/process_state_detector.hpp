#pragma once

#include "detectors/detector.hpp"
#include "platform/fd_probe.hpp"
#include "platform/process_stat_reader.hpp"

#include <chrono>
#include <memory>

struct ProcessStateThresholds {
    std::chrono::seconds min_task_age{10};
    std::chrono::seconds min_idle{5};
};

// Flags a process sleeping in state 'S' with stdin attached to a terminal.
// Short sleeps are normal, so the verdict needs both an old enough task and
// a long enough idle period (whole seconds, strictly greater).
class ProcessStateDetector : public AttentionDetector {
public:
    ProcessStateDetector(std::shared_ptr<const ProcessStatReader> stat_reader,
                         std::shared_ptr<const FdProbe> fd_probe,
                         ProcessStateThresholds thresholds = {});

    std::string_view name() const override { return "process_state"; }
    std::optional<AttentionReason> check(const Task& task, const PollContext& ctx) const override;

    // check() against an explicit wall-clock time.
    std::optional<AttentionReason> check_at(const Task& task, const PollContext& ctx,
                                            std::chrono::system_clock::time_point now) const;

private:
    bool sleeping_on_terminal(int pid) const;

    std::shared_ptr<const ProcessStatReader> stat_reader_;
    std::shared_ptr<const FdProbe> fd_probe_;
    ProcessStateThresholds thresholds_;
};
