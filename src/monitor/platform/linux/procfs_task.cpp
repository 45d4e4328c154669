#include "platform/linux/procfs_task.hpp"

#include <format>
#include <fstream>
#include <unistd.h>

namespace {

std::string read_comm(const std::string& proc_root, int pid) {
    std::ifstream f(std::format("{}/{}/comm", proc_root, pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

} // namespace

std::expected<Task, ProbeError> task_from_process(int pid, const ProcfsStatReader& reader,
                                                  const std::string& proc_root) {
    auto stat = reader.read(pid);
    if (!stat) return std::unexpected(stat.error());

    auto btime = reader.boot_time();
    if (!btime) return std::unexpected(btime.error());

    long ticks = ::sysconf(_SC_CLK_TCK);
    if (ticks <= 0) return std::unexpected(ProbeError::Unreadable);

    // Sub-second part of start_ticks is kept; btime itself is whole seconds
    auto since_boot = std::chrono::milliseconds(stat->start_ticks * 1000 / static_cast<uint64_t>(ticks));
    auto boot = std::chrono::system_clock::time_point(std::chrono::seconds(*btime));

    return Task{
        .id = std::to_string(pid),
        .command = read_comm(proc_root, pid),
        .created_at = boot + std::chrono::duration_cast<std::chrono::system_clock::duration>(since_boot),
    };
}
