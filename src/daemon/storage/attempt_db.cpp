#include "attempt_db.hpp"

#include <filesystem>
#include <print>
#include <utility>

namespace fs = std::filesystem;

AttemptDb::AttemptDb() = default;

AttemptDb::~AttemptDb() {
    close();
}

bool AttemptDb::open(const std::string& path) {
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
        "INSERT INTO attempts (job_id, strategy, outcome, error, processing_time) "
        "VALUES (?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, job_id, strategy, outcome, error, processing_time "
        "FROM attempts ORDER BY id DESC LIMIT ?";

    const char* job_sql =
        "SELECT id, timestamp, job_id, strategy, outcome, error, processing_time "
        "FROM attempts WHERE job_id = ? ORDER BY id ASC";

    for (auto [sql, stmt] : {std::pair{insert_sql, &insert_stmt_},
                             std::pair{recent_sql, &recent_stmt_},
                             std::pair{job_sql, &job_stmt_}}) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
            close();
            return false;
        }
    }

    return true;
}

void AttemptDb::close() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (job_stmt_) { sqlite3_finalize(job_stmt_); job_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool AttemptDb::insert(const std::string& job_id, const std::string& strategy,
                       const std::string& outcome, const std::string& error,
                       double processing_time) {
    std::lock_guard lock(mtx_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, strategy.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, outcome.c_str(), -1, SQLITE_TRANSIENT);
    if (error.empty()) sqlite3_bind_null(insert_stmt_, 4);
    else sqlite3_bind_text(insert_stmt_, 4, error.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 5, processing_time);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<AttemptEntry> AttemptDb::recent(int limit) {
    std::lock_guard lock(mtx_);
    if (!recent_stmt_) return {};
    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    return collect(recent_stmt_);
}

std::vector<AttemptEntry> AttemptDb::for_job(const std::string& job_id) {
    std::lock_guard lock(mtx_);
    if (!job_stmt_) return {};
    sqlite3_reset(job_stmt_);
    sqlite3_bind_text(job_stmt_, 1, job_id.c_str(), -1, SQLITE_TRANSIENT);
    return collect(job_stmt_);
}

std::vector<AttemptEntry> AttemptDb::collect(sqlite3_stmt* stmt) {
    std::vector<AttemptEntry> entries;

    auto get_text = [](sqlite3_stmt* s, int col) -> std::string {
        auto* p = sqlite3_column_text(s, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        AttemptEntry e;
        e.id = sqlite3_column_int64(stmt, 0);
        e.timestamp = get_text(stmt, 1);
        e.job_id = get_text(stmt, 2);
        e.strategy = get_text(stmt, 3);
        e.outcome = get_text(stmt, 4);
        e.error = get_text(stmt, 5);
        e.processing_time = sqlite3_column_double(stmt, 6);
        entries.push_back(std::move(e));
    }
    return entries;
}

bool AttemptDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS attempts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            job_id TEXT NOT NULL,
            strategy TEXT NOT NULL,
            outcome TEXT NOT NULL,
            error TEXT,
            processing_time REAL
        );
        CREATE INDEX IF NOT EXISTS attempts_job ON attempts(job_id);
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
