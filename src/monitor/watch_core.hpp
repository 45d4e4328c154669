#pragma once

#include "config.hpp"
#include "detectors/detector_registry.hpp"
#include "platform/process_stat_reader.hpp"
#include "poll_tracker.hpp"
#include "storage/attention_log.hpp"
#include "task.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

// Polls one process: samples its stat, threads the caller-side history
// through PollTracker, runs the registry and reports verdict transitions.
class WatchCore {
public:
    using RaisedCallback = std::function<void(const Task&, const Finding&, const PollContext&)>;

    struct PollResult {
        bool process_gone = false;
        std::vector<Finding> findings;  // every verdict this poll
        std::vector<Finding> raised;    // verdicts not present on the previous poll
    };

    WatchCore(Config config, bool verbose, int pid, Task task,
              const ProcessStatReader& stat_reader, DetectorRegistry registry,
              RaisedCallback on_raised);

    WatchCore(const WatchCore&) = delete;
    WatchCore& operator=(const WatchCore&) = delete;

    // Opens the attention log when history is enabled. A log that fails to
    // open only disables history.
    bool init();

    PollResult poll(std::chrono::steady_clock::time_point now);

    const Task& task() const { return task_; }
    const std::vector<Finding>& active() const { return active_; }
    AttentionLog& attention_log() { return log_db_; }

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    int pid_;
    Task task_;
    const ProcessStatReader& stat_reader_;
    DetectorRegistry registry_;
    RaisedCallback on_raised_;

    PollTracker tracker_;
    AttentionLog log_db_;
    std::vector<Finding> active_;
};
