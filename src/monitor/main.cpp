#include "config.hpp"
#include "detectors/detector_registry.hpp"
#include "platform/linux/linux_watch_loop.hpp"
#include "platform/linux/procfs_stat_reader.hpp"
#include "platform/linux/procfs_task.hpp"
#include "storage/attention_log.hpp"

#include <charconv>
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println("Usage: {} [options] <pid>", prog);
    std::println("Options:");
    std::println("  -v, --verbose         Enable verbose logging");
    std::println("  -c, --config PATH     Config file path");
    std::println("  --check               Classify once and print JSON, then exit");
    std::println("  --idle SECONDS        Idle duration for --check (default 0)");
    std::println("  --last-cpu TICKS      Previous CPU sample for --check");
    std::println("  --history N           Print the last N attention events and exit");
    std::println("  -h, --help            Show this help");
}

template <class T>
static bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

static json finding_json(const Finding& f) {
    return {
        {"detector", std::string(f.detector)},
        {"reason", std::string(reason_code(f.reason))},
        {"message", describe(f.reason)},
    };
}

static int run_check(const Config& config, int pid, uint64_t idle_s,
                     std::optional<uint64_t> last_cpu) {
    auto stat_reader = std::make_shared<ProcfsStatReader>();
    auto task = task_from_process(pid, *stat_reader);
    if (!task) {
        std::println(stderr, "Cannot inspect pid {}: {}", pid, to_string(task.error()));
        return 1;
    }

    auto sources = DetectorRegistry::procfs_sources(config.detectors);
    sources.stat_reader = stat_reader;
    auto registry = DetectorRegistry::from_config(config.detectors, sources);

    PollContext ctx{
        .pid = pid,
        .last_check = std::chrono::system_clock::now(),
        .last_cpu_time = last_cpu,
        .idle_duration = std::chrono::seconds(idle_s),
    };

    json out = {{"pid", pid}, {"command", task->command}, {"findings", json::array()}};
    if (auto stat = stat_reader->read(pid)) {
        out["state"] = std::string(1, stat->state);
        out["cpu_time"] = stat->cpu_time();
    }
    for (const auto& f : registry.check_all(*task, ctx)) {
        out["findings"].push_back(finding_json(f));
    }
    std::println("{}", out.dump(2));
    return 0;
}

static int print_history(const Config& config, int limit) {
    AttentionLog db;
    auto path = config.history.resolved_path();
    if (!db.open(path)) {
        std::println(stderr, "Failed to open attention log at {}", path);
        return 1;
    }

    auto events = db.recent(limit);
    if (events.empty()) {
        std::println("No attention events recorded.");
        return 0;
    }

    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        std::println("[{}] pid {} {} {}: {} (idle {:.0f}s)", it->timestamp, it->pid,
                     it->command.empty() ? "?" : it->command, it->detector, it->message,
                     it->idle_seconds);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool check = false;
    std::string config_path;
    std::optional<int> history_limit;
    uint64_t idle_s = 0;
    std::optional<uint64_t> last_cpu;
    int pid = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--check") {
            check = true;
        } else if (arg == "--idle" && i + 1 < argc) {
            if (!parse_number(argv[++i], idle_s)) {
                std::println(stderr, "Invalid --idle value: {}", argv[i]);
                return 1;
            }
        } else if (arg == "--last-cpu" && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_number(argv[++i], v)) {
                std::println(stderr, "Invalid --last-cpu value: {}", argv[i]);
                return 1;
            }
            last_cpu = v;
        } else if (arg == "--history" && i + 1 < argc) {
            int n = 0;
            if (!parse_number(argv[++i], n) || n <= 0) {
                std::println(stderr, "Invalid --history value: {}", argv[i]);
                return 1;
            }
            history_limit = n;
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (pid == 0 && parse_number(arg, pid) && pid > 0) {
            // positional pid
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (history_limit) {
        return print_history(config, *history_limit);
    }

    if (pid <= 0) {
        usage(argv[0]);
        return 1;
    }

    if (check) {
        return run_check(config, pid, idle_s, last_cpu);
    }

    LinuxWatchLoop loop(std::move(config), verbose, pid,
                        [](const Task& task, const Finding& f, const PollContext& ctx) {
                            std::println("pid {} ({}): {} [{}, idle {}s]", ctx.pid, task.command,
                                         describe(f.reason), f.detector,
                                         std::chrono::duration_cast<std::chrono::seconds>(
                                             ctx.idle_duration).count());
                        });
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize watch loop");
        return 1;
    }

    loop.run();
    return 0;
}
