#include "storage/attention_log.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

AttentionLog::AttentionLog() = default;

AttentionLog::~AttentionLog() {
    close();
}

bool AttentionLog::open(const std::string& path) {
    close();

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* insert_sql =
        "INSERT INTO attention_events (pid, task_id, command, detector, reason, message, idle_seconds) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, pid, task_id, command, detector, reason, message, idle_seconds "
        "FROM attention_events ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare recent failed: {}", sqlite3_errmsg(db_));
        close();
        return false;
    }

    return true;
}

void AttentionLog::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool AttentionLog::record(int pid, const Task& task, std::string_view detector,
                          const AttentionReason& reason, std::chrono::milliseconds idle) {
    if (!insert_stmt_) return false;

    auto message = describe(reason);
    auto code = reason_code(reason);

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    sqlite3_bind_int(insert_stmt_, 1, pid);

    auto bind_nullable = [this](int idx, std::string_view val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.data(), static_cast<int>(val.size()), SQLITE_TRANSIENT);
    };

    bind_nullable(2, task.id);
    bind_nullable(3, task.command);
    bind_nullable(4, detector);
    bind_nullable(5, code);
    bind_nullable(6, message);
    sqlite3_bind_double(insert_stmt_, 7, std::chrono::duration<double>(idle).count());

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<AttentionEvent> AttentionLog::recent(int limit) {
    std::vector<AttentionEvent> events;
    if (!recent_stmt_) return events;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        AttentionEvent e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.pid = sqlite3_column_int(recent_stmt_, 2);
        e.task_id = get_text(recent_stmt_, 3);
        e.command = get_text(recent_stmt_, 4);
        e.detector = get_text(recent_stmt_, 5);
        e.reason = get_text(recent_stmt_, 6);
        e.message = get_text(recent_stmt_, 7);
        e.idle_seconds = sqlite3_column_double(recent_stmt_, 8);
        events.push_back(std::move(e));
    }

    return events;
}

bool AttentionLog::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS attention_events (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            pid INTEGER NOT NULL,
            task_id TEXT,
            command TEXT,
            detector TEXT,
            reason TEXT NOT NULL,
            message TEXT,
            idle_seconds REAL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
