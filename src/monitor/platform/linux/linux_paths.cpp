#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

constexpr const char* kAppDir = "proc-attention";

// $<xdg_var>/proc-attention, else $HOME/<home_fallback>/proc-attention.
std::string xdg_app_dir(const char* xdg_var, const char* home_fallback) {
    if (const char* xdg = std::getenv(xdg_var); xdg && *xdg) {
        return std::string(xdg) + "/" + kAppDir;
    }
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + home_fallback + "/" + kAppDir;
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

} // namespace platform
