#include "watch_core.hpp"

#include <algorithm>
#include <format>
#include <print>

namespace {

bool same_finding(const Finding& a, const Finding& b) {
    return a.detector == b.detector && a.reason == b.reason;
}

bool contains(const std::vector<Finding>& set, const Finding& f) {
    return std::ranges::any_of(set, [&](const Finding& x) { return same_finding(x, f); });
}

} // namespace

WatchCore::WatchCore(Config config, bool verbose, int pid, Task task,
                     const ProcessStatReader& stat_reader, DetectorRegistry registry,
                     RaisedCallback on_raised)
    : config_(std::move(config)), verbose_(verbose), pid_(pid), task_(std::move(task)),
      stat_reader_(stat_reader), registry_(std::move(registry)),
      on_raised_(std::move(on_raised)),
      tracker_(pid, std::chrono::steady_clock::now()) {}

bool WatchCore::init() {
    if (registry_.empty()) {
        std::println(stderr, "No detectors enabled");
        return false;
    }

    if (config_.history.enabled) {
        auto path = config_.history.resolved_path();
        if (!log_db_.open(path)) {
            std::println(stderr, "Warning: attention log failed to open, history disabled");
        } else {
            log("Attention log at " + path);
        }
    }

    for (const auto& d : registry_.detectors()) {
        log(std::format("Detector enabled: {}", d->name()));
    }
    return true;
}

WatchCore::PollResult WatchCore::poll(std::chrono::steady_clock::time_point now) {
    PollResult result;

    auto sample = stat_reader_.read(pid_);
    if (!sample && sample.error() == ProbeError::NotFound) {
        log(std::format("Process {} is gone", pid_));
        result.process_gone = true;
        active_.clear();
        return result;
    }
    if (!sample) {
        log(std::format("stat read for {} failed: {}", pid_, to_string(sample.error())));
    }

    auto ctx = tracker_.advance(sample, now);
    result.findings = registry_.check_all(task_, ctx);

    for (const auto& f : result.findings) {
        if (contains(active_, f)) continue;

        result.raised.push_back(f);
        log(std::format("{}: {} (idle {}s)", f.detector, describe(f.reason),
                        std::chrono::duration_cast<std::chrono::seconds>(ctx.idle_duration).count()));
        if (log_db_.is_open() &&
            !log_db_.record(pid_, task_, f.detector, f.reason, ctx.idle_duration)) {
            log("Attention log write failed");
        }
        if (on_raised_) on_raised_(task_, f, ctx);
    }

    for (const auto& f : active_) {
        if (!contains(result.findings, f)) {
            log(std::format("{}: cleared ({})", f.detector, describe(f.reason)));
        }
    }

    active_ = result.findings;
    return result;
}

void WatchCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[attention-watch] {}", msg);
    }
}
