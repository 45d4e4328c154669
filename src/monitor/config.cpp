#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Reads an unsigned 32-bit key. Negative, fractional, oversized or
// non-numeric values are reported and leave `out` unchanged.
void read_u32(const json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key)) return;
    const auto& v = obj[key];
    if (!v.is_number_unsigned() || v.get<uint64_t>() > UINT32_MAX) {
        std::println(stderr, "config: {} must be a non-negative integer, keeping {}", key, out);
        return;
    }
    out = v.get<uint32_t>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        read_u32(j, "poll_interval_ms", cfg.poll_interval_ms);

        if (j.contains("detectors")) {
            auto& d = j["detectors"];

            if (d.contains("process_state")) {
                auto& p = d["process_state"];
                auto& out = cfg.detectors.process_state;
                if (p.contains("enabled")) out.enabled = p["enabled"].get<bool>();
                read_u32(p, "min_task_age_s", out.min_task_age_s);
                read_u32(p, "min_idle_s", out.min_idle_s);
            }

            if (d.contains("stall")) {
                auto& s = d["stall"];
                auto& out = cfg.detectors.stall;
                if (s.contains("enabled")) out.enabled = s["enabled"].get<bool>();
                read_u32(s, "timeout_s", out.timeout_s);
                read_u32(s, "min_task_age_s", out.min_task_age_s);
            }

            if (d.contains("stdin")) {
                auto& s = d["stdin"];
                auto& out = cfg.detectors.stdin_probe;
                if (s.contains("enabled")) out.enabled = s["enabled"].get<bool>();
                read_u32(s, "min_task_age_s", out.min_task_age_s);
                if (s.contains("tool")) out.tool = s["tool"].get<std::string>();
            }
        }

        if (j.contains("history")) {
            auto& h = j["history"];
            if (h.contains("enabled")) cfg.history.enabled = h["enabled"].get<bool>();
            if (h.contains("path")) cfg.history.path = h["path"].get<std::string>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    if (cfg.poll_interval_ms == 0) {
        std::println(stderr, "config: poll_interval_ms must be positive, using 2000");
        cfg.poll_interval_ms = 2000;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

std::string Config::History::resolved_path() const {
    if (!path.empty()) return path;
    auto data = platform::data_dir();
    if (data.empty()) return "/tmp/proc-attention/attention.db";
    return data + "/attention.db";
}
