#include "platform/linux/linux_watch_loop.hpp"

#include "platform/linux/procfs_task.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxWatchLoop::LinuxWatchLoop(Config config, bool verbose, int pid,
                               WatchCore::RaisedCallback on_raised)
    : config_(std::move(config)), verbose_(verbose), pid_(pid),
      on_raised_(std::move(on_raised)),
      stat_reader_(std::make_shared<ProcfsStatReader>()) {}

LinuxWatchLoop::~LinuxWatchLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxWatchLoop::init() {
    auto task = task_from_process(pid_, *stat_reader_);
    if (!task) {
        std::println(stderr, "Cannot watch pid {}: {}", pid_, to_string(task.error()));
        return false;
    }
    log(std::format("Watching pid {} ({})", pid_, task->command));

    auto sources = DetectorRegistry::procfs_sources(config_.detectors);
    sources.stat_reader = stat_reader_;
    auto registry = DetectorRegistry::from_config(config_.detectors, sources);

    core_ = std::make_unique<WatchCore>(config_, verbose_, pid_, std::move(*task),
                                        *stat_reader_, std::move(registry), on_raised_);
    if (!core_->init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }

    // First poll fires right away, then every poll_interval_ms
    timespec interval{
        .tv_sec = static_cast<time_t>(config_.poll_interval_ms / 1000),
        .tv_nsec = static_cast<long>(config_.poll_interval_ms % 1000) * 1000000L,
    };
    itimerspec spec{.it_interval = interval, .it_value = {.tv_sec = 0, .tv_nsec = 1}};
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_ = true;
    return true;
}

void LinuxWatchLoop::run() {
    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (running_) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                while (::read(signal_fd_, &info, sizeof(info)) > 0) {}
                log("Received signal, shutting down");
                running_ = false;
                break;
            }

            if (fd == timer_fd_) {
                uint64_t expirations;
                while (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {}

                auto result = core_->poll(std::chrono::steady_clock::now());
                if (result.process_gone) {
                    log("Watched process exited");
                    running_ = false;
                    break;
                }
            }
        }
    }
}

void LinuxWatchLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[attention-watch] {}", msg);
    }
}
