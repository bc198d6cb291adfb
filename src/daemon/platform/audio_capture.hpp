#pragma once

#include <cstdint>

// Source of mono int16 PCM written into a RingBuffer supplied at construction.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    virtual uint32_t sample_rate() const = 0;
};
