#pragma once

#include "jobs/job.hpp"

#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class LedgerError { DuplicateId, NotFound };

std::string_view to_string(LedgerError e);

// Ordered, durable store of job records. Every mutation rewrites the whole ledger file
// atomically before returning. Write failures are logged and leave the in-memory state
// authoritative; they are never reported to the caller.
class JobLedger {
public:
    JobLedger();
    ~JobLedger();

    JobLedger(const JobLedger&) = delete;
    JobLedger& operator=(const JobLedger&) = delete;

    // Loads `path` (if it exists) and persists to it from then on. A missing file yields
    // an empty ledger; an unreadable or corrupt one is logged and also yields an empty
    // ledger. Returns false only in the corrupt case.
    bool open(const std::string& path);

    std::expected<void, LedgerError> add(const Job& job);
    std::expected<void, LedgerError> update(const Job& job);
    void remove(const JobId& id);
    void clear();

    std::optional<Job> find(const JobId& id) const;
    bool contains(const JobId& id) const;

    std::vector<Job> list() const;
    std::vector<Job> queued() const;
    std::vector<Job> running() const;
    std::vector<Job> completed() const;
    std::vector<Job> failed() const;

    size_t size() const;
    const std::string& path() const { return path_; }

    // True unless the most recent write to disk failed.
    bool persisted() const;

private:
    template <typename Pred>
    std::vector<Job> filter(Pred pred) const;

    void persist_locked();

    mutable std::mutex mtx_;
    std::vector<Job> jobs_;
    std::string path_;
    bool persisted_ = true;
};
