#pragma once

#include <cstdint>
#include <string>

struct Config {
    uint32_t poll_interval_ms = 2000;

    struct Detectors {
        struct ProcessState {
            bool enabled = true;
            uint32_t min_task_age_s = 10;
            uint32_t min_idle_s = 5;
        } process_state;

        struct Stall {
            bool enabled = true;
            uint32_t timeout_s = 600;
            uint32_t min_task_age_s = 30;
        } stall;

        // Spawns lsof on every poll, so off unless asked for.
        struct Stdin {
            bool enabled = false;
            uint32_t min_task_age_s = 30;
            std::string tool = "lsof";
        } stdin_probe;
    } detectors;

    struct History {
        bool enabled = true;
        std::string path;  // empty: <data_dir>/attention.db

        std::string resolved_path() const;
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
