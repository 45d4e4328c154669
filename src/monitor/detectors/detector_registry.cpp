#include "detectors/detector_registry.hpp"

#include "detectors/process_state_detector.hpp"
#include "detectors/stall_detector.hpp"
#include "detectors/stdin_detector.hpp"
#include "platform/linux/lsof_stdin_probe.hpp"
#include "platform/linux/procfs_fd_probe.hpp"
#include "platform/linux/procfs_stat_reader.hpp"

#include <algorithm>
#include <chrono>

DetectorRegistry::DetectorRegistry(std::vector<DetectorPtr> detectors)
    : detectors_(std::move(detectors)) {
    std::erase(detectors_, nullptr);
}

DetectorRegistry DetectorRegistry::create_default() {
    auto stat_reader = std::make_shared<ProcfsStatReader>();
    auto fd_probe = std::make_shared<ProcfsFdProbe>();

    return DetectorRegistry({
        std::make_shared<ProcessStateDetector>(stat_reader, fd_probe),
        std::make_shared<StallDetector>(
            stat_reader, StallThresholds{.timeout = std::chrono::seconds(600)}),
    });
}

DetectorRegistry::Sources DetectorRegistry::procfs_sources(const Config::Detectors& cfg) {
    Sources sources{
        .stat_reader = std::make_shared<ProcfsStatReader>(),
        .fd_probe = std::make_shared<ProcfsFdProbe>(),
        .stdin_probe = nullptr,
    };
    if (cfg.stdin_probe.enabled) {
        sources.stdin_probe = std::make_shared<LsofStdinProbe>(cfg.stdin_probe.tool);
    }
    return sources;
}

DetectorRegistry DetectorRegistry::from_config(const Config::Detectors& cfg,
                                               const Sources& sources) {
    using std::chrono::seconds;
    std::vector<DetectorPtr> detectors;

    if (cfg.process_state.enabled && sources.stat_reader && sources.fd_probe) {
        detectors.push_back(std::make_shared<ProcessStateDetector>(
            sources.stat_reader, sources.fd_probe,
            ProcessStateThresholds{
                .min_task_age = seconds(cfg.process_state.min_task_age_s),
                .min_idle = seconds(cfg.process_state.min_idle_s),
            }));
    }

    if (cfg.stall.enabled && sources.stat_reader) {
        detectors.push_back(std::make_shared<StallDetector>(
            sources.stat_reader,
            StallThresholds{
                .timeout = seconds(cfg.stall.timeout_s),
                .min_task_age = seconds(cfg.stall.min_task_age_s),
            }));
    }

    if (cfg.stdin_probe.enabled && sources.stdin_probe) {
        detectors.push_back(std::make_shared<StdinDetector>(
            sources.stdin_probe,
            StdinThresholds{.min_task_age = seconds(cfg.stdin_probe.min_task_age_s)}));
    }

    return DetectorRegistry(std::move(detectors));
}

std::optional<AttentionReason> DetectorRegistry::check(const Task& task,
                                                       const PollContext& ctx) const {
    for (const auto& d : detectors_) {
        if (auto reason = d->check(task, ctx)) return reason;
    }
    return std::nullopt;
}

std::vector<Finding> DetectorRegistry::check_all(const Task& task, const PollContext& ctx) const {
    std::vector<Finding> findings;
    for (const auto& d : detectors_) {
        if (auto reason = d->check(task, ctx)) {
            findings.push_back(Finding{.detector = d->name(), .reason = std::move(*reason)});
        }
    }
    return findings;
}
