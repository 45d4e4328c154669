#include "platform/linux/procfs_fd_probe.hpp"

#include <filesystem>
#include <format>
#include <system_error>

namespace fs = std::filesystem;

ProcfsFdProbe::ProcfsFdProbe(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::expected<std::string, ProbeError> ProcfsFdProbe::resolve(int pid, int fd) const {
    if (pid <= 0 || fd < 0) return std::unexpected(ProbeError::NotFound);

    std::error_code ec;
    auto target = fs::read_symlink(std::format("{}/{}/fd/{}", proc_root_, pid, fd), ec);
    if (ec) {
        // Exited process and closed descriptor both surface as ENOENT
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::no_such_process) {
            return std::unexpected(ProbeError::NotFound);
        }
        return std::unexpected(ProbeError::Unreadable);
    }
    return target.string();
}
