#pragma once

#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>

struct StreamingCallbacks {
    // Hypothesis for the audio since the last final; replaces the previous one.
    std::function<void(const std::string&)> on_partial;
    // Settled text; appended to the transcript.
    std::function<void(const std::string&)> on_final;
    std::function<void(const std::string&)> on_error;
};

// Incremental speech recognizer. feed() is called from the capture pump thread;
// callbacks may arrive on any thread the engine owns.
class StreamingEngine {
public:
    virtual ~StreamingEngine() = default;
    virtual std::string_view name() const = 0;
    virtual bool start(StreamingCallbacks callbacks) = 0;
    virtual void feed(std::span<const int16_t> samples) = 0;
    // Stops recognition. No callbacks are made after stop() returns.
    virtual void stop() = 0;
};
