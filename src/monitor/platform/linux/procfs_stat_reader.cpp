#include "platform/linux/procfs_stat_reader.hpp"

#include <cerrno>
#include <charconv>
#include <fcntl.h>
#include <format>
#include <string_view>
#include <unistd.h>

ProcfsStatReader::ProcfsStatReader(std::string proc_root)
    : proc_root_(std::move(proc_root)) {}

std::expected<std::string, ProbeError> ProcfsStatReader::read_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT || errno == ESRCH) return std::unexpected(ProbeError::NotFound);
        return std::unexpected(ProbeError::Unreadable);
    }

    std::string content;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            // The task exited between open() and read()
            int err = errno;
            ::close(fd);
            if (err == ESRCH) return std::unexpected(ProbeError::NotFound);
            return std::unexpected(ProbeError::Unreadable);
        }
        if (n == 0) break;
        content.append(buf, static_cast<size_t>(n));
    }
    ::close(fd);
    return content;
}

std::expected<ProcessStat, ProbeError> ProcfsStatReader::read(int pid) const {
    if (pid <= 0) return std::unexpected(ProbeError::NotFound);

    auto content = read_file(std::format("{}/{}/stat", proc_root_, pid));
    if (!content) return std::unexpected(content.error());
    return parse_stat(*content);
}

std::expected<uint64_t, ProbeError> ProcfsStatReader::boot_time() const {
    auto content = read_file(proc_root_ + "/stat");
    if (!content) return std::unexpected(content.error());

    std::string_view text = *content;
    constexpr std::string_view key = "btime ";
    size_t pos = 0;
    while (pos < text.size()) {
        auto eol = text.find('\n', pos);
        auto line = text.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        if (line.starts_with(key)) {
            auto value = line.substr(key.size());
            uint64_t btime = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), btime);
            if (ec != std::errc{}) return std::unexpected(ProbeError::Malformed);
            return btime;
        }
        if (eol == std::string_view::npos) break;
        pos = eol + 1;
    }
    return std::unexpected(ProbeError::Malformed);
}
