#pragma once

#include "platform/linux/procfs_stat_reader.hpp"
#include "task.hpp"

#include <expected>
#include <string>

// Describe a running process as a Task, created at the process start time.
std::expected<Task, ProbeError> task_from_process(int pid, const ProcfsStatReader& reader,
                                                  const std::string& proc_root = "/proc");
