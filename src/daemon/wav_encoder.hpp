#pragma once

#include <cstdint>
#include <cstring>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <vector>

// Minimal RIFF/WAVE support: mono int16 PCM encoding for captured audio, and header
// inspection for imported files.
namespace wav {

struct Info {
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_size = 0;

    double duration_s() const {
        uint32_t bytes_per_s = sample_rate * channels * bits_per_sample / 8;
        return bytes_per_s ? static_cast<double>(data_size) / bytes_per_s : 0.0;
    }
};

inline std::vector<uint8_t> encode(std::span<const int16_t> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);                // subchunk1 size
    w16(1);                 // PCM format
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);
    if (data_size) std::memcpy(out.data() + 44, samples.data(), data_size);

    return out;
}

// Walks the chunk list for "fmt " and "data". Returns nullopt for anything that is not a
// well-formed RIFF/WAVE header.
inline std::optional<Info> parse_header(std::span<const uint8_t> bytes) {
    auto r16 = [&](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };

    if (bytes.size() < 12) return std::nullopt;
    if (std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }

    Info info;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = r32(pos + 4);
        if (std::memcmp(bytes.data() + pos, "fmt ", 4) == 0) {
            if (pos + 8 + 16 > bytes.size()) return std::nullopt;
            info.format = r16(pos + 8);
            info.channels = r16(pos + 10);
            info.sample_rate = r32(pos + 12);
            info.bits_per_sample = r16(pos + 22);
            have_fmt = true;
        } else if (std::memcmp(bytes.data() + pos, "data", 4) == 0) {
            if (!have_fmt) return std::nullopt;
            info.data_size = chunk_size;
            return info;
        }
        pos += 8 + chunk_size + (chunk_size & 1);
    }
    return std::nullopt;
}

// Reads just enough of `path` to parse its header.
inline std::optional<Info> read_info(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    std::vector<uint8_t> head(4096);
    f.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<size_t>(f.gcount()));
    return parse_header(head);
}

} // namespace wav
