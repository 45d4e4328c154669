#pragma once

#include "platform/fd_probe.hpp"

#include <string>

class ProcfsFdProbe : public FdProbe {
public:
    explicit ProcfsFdProbe(std::string proc_root = "/proc");

    std::expected<std::string, ProbeError> resolve(int pid, int fd) const override;

private:
    std::string proc_root_;
};
