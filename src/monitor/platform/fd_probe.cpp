#include "platform/fd_probe.hpp"

bool is_interactive_terminal(std::string_view target) {
    return target.find("/dev/pts/") != std::string_view::npos ||
           target.find("/dev/tty") != std::string_view::npos;
}
