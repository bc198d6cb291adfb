#include "capture_status.hpp"

#include <vector>

CaptureStatus::Snapshot CaptureStatus::snapshot() const {
    std::lock_guard lock(mtx_);
    return state_;
}

bool CaptureStatus::is_live_streaming() const {
    std::lock_guard lock(mtx_);
    return state_.live_streaming;
}

bool CaptureStatus::is_recording() const {
    std::lock_guard lock(mtx_);
    return state_.recording_job.has_value();
}

int CaptureStatus::subscribe(Listener listener) {
    std::lock_guard lock(mtx_);
    int token = next_token_++;
    listeners_.emplace(token, std::move(listener));
    return token;
}

void CaptureStatus::unsubscribe(int token) {
    std::lock_guard lock(mtx_);
    listeners_.erase(token);
}

void CaptureStatus::set_recording(std::optional<JobId> job) {
    std::unique_lock lock(mtx_);
    if (state_.recording_job == job) return;
    state_.recording_job = std::move(job);
    publish(lock);
}

void CaptureStatus::set_live(std::optional<std::string> backend) {
    std::unique_lock lock(mtx_);
    bool streaming = backend.has_value();
    if (state_.live_streaming == streaming && state_.live_backend == backend) return;
    state_.live_streaming = streaming;
    state_.live_backend = std::move(backend);
    publish(lock);
}

void CaptureStatus::reset() {
    std::unique_lock lock(mtx_);
    if (state_.idle()) return;
    state_ = {};
    publish(lock);
}

void CaptureStatus::publish(std::unique_lock<std::mutex>& lock) {
    auto snap = state_;
    std::vector<Listener> listeners;
    listeners.reserve(listeners_.size());
    for (auto& [_, l] : listeners_) listeners.push_back(l);
    lock.unlock();

    for (auto& l : listeners) l(snap);
}
