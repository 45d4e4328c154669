#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

enum class ProbeError { NotFound, Unreadable, Malformed };

std::string_view to_string(ProbeError err);

// Fields of /proc/<pid>/stat the detectors care about.
struct ProcessStat {
    char state = '?';
    uint64_t utime = 0;        // field 14, clock ticks
    uint64_t stime = 0;        // field 15, clock ticks
    uint64_t start_ticks = 0;  // field 22, ticks since boot (0 if absent)

    uint64_t cpu_time() const { return utime + stime; }
};

// Parse the contents of a stat record. The comm field may contain spaces
// and parentheses, so fields are counted from the last ')'.
std::expected<ProcessStat, ProbeError> parse_stat(std::string_view content);

class ProcessStatReader {
public:
    virtual ~ProcessStatReader() = default;
    virtual std::expected<ProcessStat, ProbeError> read(int pid) const = 0;
};
