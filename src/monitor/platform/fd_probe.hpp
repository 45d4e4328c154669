#pragma once

#include "platform/process_stat_reader.hpp"

#include <expected>
#include <string>
#include <string_view>

class FdProbe {
public:
    virtual ~FdProbe() = default;
    // What descriptor `fd` of `pid` points at, e.g. "/dev/pts/3" or "pipe:[1234]".
    virtual std::expected<std::string, ProbeError> resolve(int pid, int fd) const = 0;
};

// True for pseudo-terminal and tty device targets.
bool is_interactive_terminal(std::string_view target);
