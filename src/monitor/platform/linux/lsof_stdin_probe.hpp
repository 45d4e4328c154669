#pragma once

#include "platform/stdin_probe.hpp"

#include <expected>
#include <string>

// Asks lsof(8) whether descriptor 0 of a process is open. Every call
// spawns the tool, so this probe is not part of the default detector set.
class LsofStdinProbe : public StdinProbe {
public:
    explicit LsofStdinProbe(std::string tool = "lsof");

    bool reading_stdin(int pid) const override;

    // Raw stdout of `<tool> -p <pid> -a -d 0`, or an error if the tool
    // could not be spawned or exited non-zero.
    std::expected<std::string, std::string> query(int pid) const;

private:
    std::string tool_;
};

// More than one line (header plus at least one row) means fd 0 is open.
bool lsof_reports_descriptor(const std::string& output);
