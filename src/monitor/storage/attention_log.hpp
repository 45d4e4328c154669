#pragma once

#include "attention_reason.hpp"
#include "task.hpp"

#include <chrono>
#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <string_view>
#include <vector>

struct AttentionEvent {
    int64_t id = 0;
    std::string timestamp;
    int pid = 0;
    std::string task_id;
    std::string command;
    std::string detector;
    std::string reason;   // reason_code()
    std::string message;  // describe()
    double idle_seconds = 0.0;
};

// Verdicts raised while watching, newest last. Task state itself is not kept.
class AttentionLog {
public:
    AttentionLog();
    ~AttentionLog();

    AttentionLog(const AttentionLog&) = delete;
    AttentionLog& operator=(const AttentionLog&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool record(int pid, const Task& task, std::string_view detector,
                const AttentionReason& reason, std::chrono::milliseconds idle);

    std::vector<AttentionEvent> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
