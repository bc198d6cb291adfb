#pragma once

#include "jobs/job.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

struct JobEvent {
    enum class Kind { Added, Updated, Removed };

    Kind kind = Kind::Updated;
    Job job; // state after the change; for Removed, the last known state
};

std::string_view to_string(JobEvent::Kind k);

using JobObserver = std::function<void(const JobEvent&)>;

// Delivers job events to observers on its own thread so publishers never block on them.
// A non-terminal Updated event replaces one for the same job that is still waiting in the
// queue; Added, Removed and terminal updates are always delivered, in order.
class JobEventDispatcher {
public:
    JobEventDispatcher();
    ~JobEventDispatcher();

    JobEventDispatcher(const JobEventDispatcher&) = delete;
    JobEventDispatcher& operator=(const JobEventDispatcher&) = delete;

    void publish(JobEvent event);

    int subscribe(JobObserver observer);
    void unsubscribe(int token);

    // Blocks until every event published so far has been delivered.
    void flush();

private:
    void run(std::stop_token stop);

    std::mutex mtx_;
    std::condition_variable_any cv_;
    std::condition_variable_any drained_;
    std::deque<JobEvent> queue_;
    bool delivering_ = false;

    std::mutex observers_mtx_;
    std::map<int, JobObserver> observers_;
    int next_token_ = 1;

    std::jthread thread_;
};
