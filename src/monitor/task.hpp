#pragma once

#include <chrono>
#include <string>

// A monitored task as handed over by the task manager. Only created_at
// is consulted by the detectors.
struct Task {
    std::string id;
    std::string command;
    std::chrono::system_clock::time_point created_at;
};

// Whole seconds between created_at and now, both floored to the second
// before subtracting. Negative if created_at lies in the future.
inline std::chrono::seconds task_age(const Task& task,
                                     std::chrono::system_clock::time_point now) {
    return std::chrono::floor<std::chrono::seconds>(now) -
           std::chrono::floor<std::chrono::seconds>(task.created_at);
}
