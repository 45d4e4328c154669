#include "platform/linux/lsof_stdin_probe.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

LsofStdinProbe::LsofStdinProbe(std::string tool)
    : tool_(std::move(tool)) {}

bool LsofStdinProbe::reading_stdin(int pid) const {
    if (pid <= 0) return false;
    auto out = query(pid);
    if (!out) return false;
    return lsof_reports_descriptor(*out);
}

std::expected<std::string, std::string> LsofStdinProbe::query(int pid) const {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    auto pid_arg = std::to_string(pid);

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (child == 0) {
        // The watch loop blocks SIGINT/SIGTERM for signalfd; the mask survives exec
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        ::dup2(fds[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::execlp(tool_.c_str(), tool_.c_str(), "-p", pid_arg.c_str(), "-a", "-d", "0", nullptr);
        ::_exit(127);
    }

    ::close(fds[1]);

    std::string output;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        output.append(buf, static_cast<size_t>(n));
    }
    ::close(fds[0]);

    int status;
    while (::waitpid(child, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
    }

    if (!WIFEXITED(status)) {
        return std::unexpected(tool_ + " terminated by signal");
    }
    if (WEXITSTATUS(status) != 0) {
        return std::unexpected(tool_ + " failed with code " + std::to_string(WEXITSTATUS(status)));
    }

    return output;
}

bool lsof_reports_descriptor(const std::string& output) {
    auto lines = std::ranges::count(output, '\n');
    if (!output.empty() && output.back() != '\n') ++lines;
    return lines > 1;
}
