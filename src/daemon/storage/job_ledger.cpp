#include "job_ledger.hpp"

#include "jobs/job_json.hpp"
#include "storage/atomic_file.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string_view to_string(LedgerError e) {
    switch (e) {
        case LedgerError::DuplicateId: return "duplicate job id";
        case LedgerError::NotFound: return "job not found";
    }
    return "unknown ledger error";
}

JobLedger::JobLedger() = default;

JobLedger::~JobLedger() = default;

bool JobLedger::open(const std::string& path) {
    std::lock_guard lock(mtx_);
    path_ = path;
    jobs_.clear();

    std::ifstream f(path);
    if (!f.is_open()) {
        // First run: nothing stored yet.
        return true;
    }

    try {
        auto j = json::parse(f);
        jobs_ = j.get<std::vector<Job>>();
    } catch (const std::exception& e) {
        std::println(stderr, "ledger: failed to load {}: {}; starting empty", path, e.what());
        jobs_.clear();
        return false;
    }
    return true;
}

std::expected<void, LedgerError> JobLedger::add(const Job& job) {
    std::lock_guard lock(mtx_);
    if (std::ranges::any_of(jobs_, [&](const Job& j) { return j.id == job.id; })) {
        return std::unexpected(LedgerError::DuplicateId);
    }
    jobs_.push_back(job);
    persist_locked();
    return {};
}

std::expected<void, LedgerError> JobLedger::update(const Job& job) {
    std::lock_guard lock(mtx_);
    auto it = std::ranges::find_if(jobs_, [&](const Job& j) { return j.id == job.id; });
    if (it == jobs_.end()) {
        return std::unexpected(LedgerError::NotFound);
    }
    *it = job;
    persist_locked();
    return {};
}

void JobLedger::remove(const JobId& id) {
    std::lock_guard lock(mtx_);
    auto removed = std::erase_if(jobs_, [&](const Job& j) { return j.id == id; });
    if (removed > 0) persist_locked();
}

void JobLedger::clear() {
    std::lock_guard lock(mtx_);
    jobs_.clear();
    persist_locked();
}

std::optional<Job> JobLedger::find(const JobId& id) const {
    std::lock_guard lock(mtx_);
    auto it = std::ranges::find_if(jobs_, [&](const Job& j) { return j.id == id; });
    if (it == jobs_.end()) return std::nullopt;
    return *it;
}

bool JobLedger::contains(const JobId& id) const {
    return find(id).has_value();
}

std::vector<Job> JobLedger::list() const {
    std::lock_guard lock(mtx_);
    return jobs_;
}

template <typename Pred>
std::vector<Job> JobLedger::filter(Pred pred) const {
    std::lock_guard lock(mtx_);
    std::vector<Job> out;
    std::ranges::copy_if(jobs_, std::back_inserter(out), pred);
    return out;
}

std::vector<Job> JobLedger::queued() const {
    return filter([](const Job& j) { return j.status == JobStatus::Queued; });
}

std::vector<Job> JobLedger::running() const {
    return filter([](const Job& j) { return j.is_active(); });
}

std::vector<Job> JobLedger::completed() const {
    return filter([](const Job& j) { return j.status == JobStatus::Completed; });
}

std::vector<Job> JobLedger::failed() const {
    return filter([](const Job& j) { return j.status == JobStatus::Failed; });
}

size_t JobLedger::size() const {
    std::lock_guard lock(mtx_);
    return jobs_.size();
}

bool JobLedger::persisted() const {
    std::lock_guard lock(mtx_);
    return persisted_;
}

void JobLedger::persist_locked() {
    if (path_.empty()) return;

    std::string data;
    try {
        data = json(jobs_).dump(2);
    } catch (const json::exception& e) {
        std::println(stderr, "ledger: serialize failed: {}", e.what());
        persisted_ = false;
        return;
    }

    auto res = atomic_write(path_, data);
    if (!res) {
        std::println(stderr, "ledger: write failed: {}", res.error());
        persisted_ = false;
        return;
    }
    persisted_ = true;
}
