#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct AttemptEntry {
    int64_t id;
    std::string timestamp;
    std::string job_id;
    std::string strategy;
    std::string outcome; // "completed", "failed", "cancelled"
    std::string error;
    double processing_time;
};

// Append-only log of every backend attempt, for `wctl attempts`. Safe to share between
// the orchestrator thread and the IPC thread.
class AttemptDb {
public:
    AttemptDb();
    ~AttemptDb();

    AttemptDb(const AttemptDb&) = delete;
    AttemptDb& operator=(const AttemptDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& job_id, const std::string& strategy,
                const std::string& outcome, const std::string& error, double processing_time);

    std::vector<AttemptEntry> recent(int limit = 20);
    std::vector<AttemptEntry> for_job(const std::string& job_id);

private:
    bool create_tables();
    std::vector<AttemptEntry> collect(sqlite3_stmt* stmt);

    std::mutex mtx_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* job_stmt_ = nullptr;
};
