#pragma once

#include "config.hpp"
#include "detectors/detector.hpp"
#include "platform/fd_probe.hpp"
#include "platform/process_stat_reader.hpp"
#include "platform/stdin_probe.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

struct Finding {
    std::string_view detector;
    AttentionReason reason;
};

// Ordered, immutable set of detectors. Copies share the same detector
// instances, which are safe to check concurrently.
class DetectorRegistry {
public:
    using DetectorPtr = std::shared_ptr<const AttentionDetector>;

    explicit DetectorRegistry(std::vector<DetectorPtr> detectors);

    // {process_state, stall(600s)} against /proc. The lsof-based stdin
    // detector is left out.
    static DetectorRegistry create_default();

    // Platform sources the configured detectors read from.
    struct Sources {
        std::shared_ptr<const ProcessStatReader> stat_reader;
        std::shared_ptr<const FdProbe> fd_probe;
        std::shared_ptr<const StdinProbe> stdin_probe;  // may be null when stdin is disabled
    };

    static Sources procfs_sources(const Config::Detectors& cfg);
    static DetectorRegistry from_config(const Config::Detectors& cfg, const Sources& sources);

    // First verdict in registry order.
    std::optional<AttentionReason> check(const Task& task, const PollContext& ctx) const;

    // Every verdict, in registry order.
    std::vector<Finding> check_all(const Task& task, const PollContext& ctx) const;

    const std::vector<DetectorPtr>& detectors() const { return detectors_; }
    size_t size() const { return detectors_.size(); }
    bool empty() const { return detectors_.empty(); }

private:
    std::vector<DetectorPtr> detectors_;
};
