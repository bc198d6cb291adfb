#include "job_events.hpp"

#include <algorithm>
#include <exception>
#include <print>
#include <vector>

std::string_view to_string(JobEvent::Kind k) {
    switch (k) {
        case JobEvent::Kind::Added: return "added";
        case JobEvent::Kind::Updated: return "updated";
        case JobEvent::Kind::Removed: return "removed";
    }
    return "unknown";
}

JobEventDispatcher::JobEventDispatcher()
    : thread_([this](std::stop_token st) { run(st); }) {}

JobEventDispatcher::~JobEventDispatcher() {
    thread_.request_stop();
    cv_.notify_all();
}

void JobEventDispatcher::publish(JobEvent event) {
    {
        std::lock_guard lock(mtx_);
        if (event.kind == JobEvent::Kind::Updated && !event.job.is_terminal()) {
            auto last = std::find_if(queue_.rbegin(), queue_.rend(), [&](const JobEvent& e) {
                return e.job.id == event.job.id;
            });
            if (last != queue_.rend() && last->kind == JobEvent::Kind::Updated &&
                !last->job.is_terminal()) {
                *last = std::move(event);
                return;
            }
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

int JobEventDispatcher::subscribe(JobObserver observer) {
    std::lock_guard lock(observers_mtx_);
    int token = next_token_++;
    observers_.emplace(token, std::move(observer));
    return token;
}

void JobEventDispatcher::unsubscribe(int token) {
    std::lock_guard lock(observers_mtx_);
    observers_.erase(token);
}

void JobEventDispatcher::flush() {
    std::unique_lock lock(mtx_);
    drained_.wait(lock, [this] { return queue_.empty() && !delivering_; });
}

void JobEventDispatcher::run(std::stop_token stop) {
    while (true) {
        JobEvent event;
        {
            std::unique_lock lock(mtx_);
            cv_.wait(lock, stop, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                // Stopped with nothing left to deliver.
                drained_.notify_all();
                return;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        std::vector<JobObserver> observers;
        {
            std::lock_guard lock(observers_mtx_);
            for (auto& [_, o] : observers_) observers.push_back(o);
        }
        for (auto& o : observers) {
            // One failing observer must not keep the event from the others.
            try {
                o(event);
            } catch (const std::exception& e) {
                std::println(stderr, "events: observer failed on {} {}: {}",
                             to_string(event.kind), event.job.id, e.what());
            }
        }

        {
            std::lock_guard lock(mtx_);
            delivering_ = false;
            if (queue_.empty()) drained_.notify_all();
        }
    }
}
