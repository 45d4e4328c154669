#pragma once

#include "config.hpp"
#include "platform/linux/procfs_stat_reader.hpp"
#include "watch_core.hpp"

#include <memory>

class LinuxWatchLoop {
public:
    LinuxWatchLoop(Config config, bool verbose, int pid,
                   WatchCore::RaisedCallback on_raised);
    ~LinuxWatchLoop();

    LinuxWatchLoop(const LinuxWatchLoop&) = delete;
    LinuxWatchLoop& operator=(const LinuxWatchLoop&) = delete;

    bool init();
    // Polls until the process exits or SIGINT/SIGTERM arrives.
    void run();

private:
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    int pid_;
    WatchCore::RaisedCallback on_raised_;

    std::shared_ptr<ProcfsStatReader> stat_reader_;
    std::unique_ptr<WatchCore> core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;

    bool running_ = false;
};
