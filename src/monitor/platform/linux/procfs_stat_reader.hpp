#pragma once

#include "platform/process_stat_reader.hpp"

#include <cstdint>
#include <expected>
#include <string>

class ProcfsStatReader : public ProcessStatReader {
public:
    explicit ProcfsStatReader(std::string proc_root = "/proc");

    std::expected<ProcessStat, ProbeError> read(int pid) const override;

    // System boot time in seconds since the epoch (btime in <proc_root>/stat).
    std::expected<uint64_t, ProbeError> boot_time() const;

private:
    static std::expected<std::string, ProbeError> read_file(const std::string& path);

    std::string proc_root_;
};
