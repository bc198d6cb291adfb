#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Single-producer single-consumer byte ring for captured PCM.
// The PipeWire thread writes; the recording session or the live pump drains.
// Bytes that do not fit are dropped and counted in dropped().
class RingBuffer {
public:
    explicit RingBuffer(size_t capacity_bytes)
        : buf_(capacity_bytes), capacity_(capacity_bytes) {}

    // Producer. Returns the number of bytes stored.
    size_t write(const void* data, size_t len) {
        size_t head = write_pos_.load(std::memory_order_relaxed);
        size_t free_bytes = capacity_ - (head - read_pos_.load(std::memory_order_acquire));

        size_t n = std::min(len, free_bytes);
        if (n < len) dropped_.fetch_add(len - n, std::memory_order_relaxed);
        if (n == 0) return 0;

        copy_in(head, static_cast<const uint8_t*>(data), n);
        write_pos_.store(head + n, std::memory_order_release);
        return n;
    }

    // Consumer. Returns the number of bytes copied into dest.
    size_t read(void* dest, size_t max_len) {
        size_t tail = read_pos_.load(std::memory_order_relaxed);
        size_t n = std::min(max_len, write_pos_.load(std::memory_order_acquire) - tail);
        if (n == 0) return 0;

        copy_out(tail, static_cast<uint8_t*>(dest), n);
        read_pos_.store(tail + n, std::memory_order_release);
        return n;
    }

    // Consumer: appends up to max_samples whole int16 samples. A trailing odd byte stays.
    size_t drain_into(std::vector<int16_t>& out, size_t max_samples) {
        size_t n = std::min(available() / sizeof(int16_t), max_samples);
        if (n == 0) return 0;

        size_t old_size = out.size();
        out.resize(old_size + n);
        read(out.data() + old_size, n * sizeof(int16_t));
        return n;
    }

    std::vector<int16_t> drain_all() {
        std::vector<int16_t> samples;
        drain_into(samples, available() / sizeof(int16_t));
        return samples;
    }

    size_t available() const {
        return write_pos_.load(std::memory_order_acquire) -
               read_pos_.load(std::memory_order_acquire);
    }

    size_t dropped() const { return dropped_.load(std::memory_order_relaxed); }
    size_t capacity() const { return capacity_; }

    // Only while the producer is stopped.
    void reset() {
        read_pos_.store(0, std::memory_order_relaxed);
        write_pos_.store(0, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);
    }

private:
    void copy_in(size_t pos, const uint8_t* src, size_t n) {
        size_t at = pos % capacity_;
        size_t split = std::min(n, capacity_ - at);
        std::memcpy(buf_.data() + at, src, split);
        std::memcpy(buf_.data(), src + split, n - split);
    }

    void copy_out(size_t pos, uint8_t* dst, size_t n) const {
        size_t at = pos % capacity_;
        size_t split = std::min(n, capacity_ - at);
        std::memcpy(dst, buf_.data() + at, split);
        std::memcpy(dst + split, buf_.data(), n - split);
    }

    std::vector<uint8_t> buf_;
    size_t capacity_;
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
    std::atomic<size_t> dropped_{0};
};
