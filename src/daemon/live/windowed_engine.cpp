#include "windowed_engine.hpp"
#include "whisper/http.hpp"

#include <algorithm>
#include <chrono>

WindowedEngine::WindowedEngine(std::string name, WindowTranscriber transcriber,
                               WindowOptions options)
    : name_(std::move(name)), transcriber_(std::move(transcriber)), options_(options) {}

WindowedEngine::~WindowedEngine() {
    stop();
}

bool WindowedEngine::start(StreamingCallbacks callbacks) {
    if (worker_.joinable() || !transcriber_) return false;

    callbacks_ = std::move(callbacks);
    {
        std::lock_guard lock(mtx_);
        pending_.clear();
    }
    worker_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void WindowedEngine::feed(std::span<const int16_t> samples) {
    std::lock_guard lock(mtx_);
    pending_.insert(pending_.end(), samples.begin(), samples.end());

    // At most one window plus one hop is kept; the oldest samples go first.
    auto limit = static_cast<size_t>((options_.window_seconds + options_.hop_seconds) *
                                     options_.sample_rate);
    if (pending_.size() > limit) {
        pending_.erase(pending_.begin(),
                       pending_.end() - static_cast<std::ptrdiff_t>(limit));
    }
}

size_t WindowedEngine::buffered_samples() const {
    std::lock_guard lock(mtx_);
    return pending_.size();
}

void WindowedEngine::stop() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    worker_.join();
    worker_ = {};
}

void WindowedEngine::run(std::stop_token stop) {
    auto hop = std::chrono::milliseconds(static_cast<int64_t>(options_.hop_seconds * 1000));
    auto window = static_cast<size_t>(options_.window_seconds * options_.sample_rate);
    auto minimum = static_cast<size_t>(options_.min_seconds * options_.sample_rate);

    while (!stop.stop_requested()) {
        interruptible_sleep(hop, stop);
        if (stop.stop_requested()) break;

        std::vector<int16_t> chunk;
        {
            std::lock_guard lock(mtx_);
            auto n = std::min(pending_.size(), window);
            chunk.assign(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
        }
        if (chunk.size() < std::max<size_t>(minimum, 1)) continue;
        bool full = chunk.size() >= window;

        auto result = transcriber_(chunk, options_.sample_rate, stop);
        if (!result && result.error().kind == FailureKind::Cancelled) break;

        // A full window is consumed whether or not it was transcribed.
        if (full) drop_front(chunk.size());

        if (!result) {
            if (callbacks_.on_error) callbacks_.on_error(result.error().message);
            continue;
        }

        if (full) {
            if (callbacks_.on_final) callbacks_.on_final(result->text);
        } else if (callbacks_.on_partial) {
            callbacks_.on_partial(result->text);
        }
    }
}

void WindowedEngine::drop_front(size_t count) {
    std::lock_guard lock(mtx_);
    auto n = std::min(count, pending_.size());
    pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(n));
}
