#include "platform/process_stat_reader.hpp"

#include <charconv>
#include <string_view>
#include <vector>

std::string_view to_string(ProbeError err) {
    switch (err) {
        case ProbeError::NotFound: return "not found";
        case ProbeError::Unreadable: return "unreadable";
        case ProbeError::Malformed: return "malformed";
    }
    return "unknown";
}

namespace {

std::vector<std::string_view> split_fields(std::string_view s) {
    std::vector<std::string_view> out;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n')) ++i;
        size_t start = i;
        while (i < s.size() && s[i] != ' ' && s[i] != '\t' && s[i] != '\n') ++i;
        if (i > start) out.push_back(s.substr(start, i - start));
    }
    return out;
}

bool parse_u64(std::string_view s, uint64_t& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

} // namespace

std::expected<ProcessStat, ProbeError> parse_stat(std::string_view content) {
    // Format: pid (comm) state ppid ... utime stime ... starttime ...
    auto comm_start = content.find('(');
    auto comm_end = content.rfind(')');
    if (comm_start == std::string_view::npos || comm_end == std::string_view::npos ||
        comm_end < comm_start) {
        return std::unexpected(ProbeError::Malformed);
    }

    // rest[0] is field 3 (state), rest[11] field 14, rest[12] field 15, rest[19] field 22
    auto rest = split_fields(content.substr(comm_end + 1));
    if (rest.size() < 13 || rest[0].size() != 1) {
        return std::unexpected(ProbeError::Malformed);
    }

    ProcessStat stat;
    stat.state = rest[0][0];
    if (!parse_u64(rest[11], stat.utime) || !parse_u64(rest[12], stat.stime)) {
        return std::unexpected(ProbeError::Malformed);
    }
    if (rest.size() > 19 && !parse_u64(rest[19], stat.start_ticks)) {
        stat.start_ticks = 0;
    }
    return stat;
}
