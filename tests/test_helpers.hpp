#pragma once

#include "platform/audio_capture.hpp"
#include "platform/connectivity.hpp"
#include "storage/model_catalog.hpp"
#include "wav_encoder.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace test {

// RAII temp directory that auto-deletes.
struct TmpDir {
    std::filesystem::path path;

    TmpDir() {
        auto tmpl = (std::filesystem::temp_directory_path() / "wc_test_XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        path = ::mkdtemp(buf.data());
    }

    ~TmpDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

inline std::vector<int16_t> tone(size_t samples) {
    std::vector<int16_t> out(samples);
    for (size_t i = 0; i < samples; ++i) out[i] = static_cast<int16_t>((i % 64) * 256 - 8192);
    return out;
}

inline void write_wav(const std::string& path, double seconds, uint32_t rate = 16000) {
    auto samples = tone(static_cast<size_t>(seconds * rate));
    auto data = wav::encode(samples, rate);
    std::ofstream f(path, std::ios::binary);
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline void write_file(const std::string& path, const std::string& content) {
    std::ofstream f(path, std::ios::binary);
    f << content;
}

// Polls `pred` until it holds or the timeout passes.
inline bool wait_for(const std::function<bool()>& pred,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

class MockAudioCapture : public AudioCapture {
public:
    bool start() override {
        if (fail_start) return false;
        capturing_ = true;
        return true;
    }
    void stop() override { capturing_ = false; }
    bool is_capturing() const override { return capturing_; }
    uint32_t sample_rate() const override { return 16000; }

    bool fail_start = false;

private:
    std::atomic<bool> capturing_{false};
};

class FakeConnectivity : public Connectivity {
public:
    bool has_active_connection() const override { return online.load(); }
    std::atomic<bool> online{true};
};

class FakeCatalog : public ModelCatalog {
public:
    bool is_available(const std::string& model_id) const override {
        return models.contains(model_id);
    }
    std::optional<std::string> checksum(const std::string& model_id) const override {
        auto it = checksums.find(model_id);
        if (it == checksums.end()) return std::nullopt;
        return it->second;
    }

    std::set<std::string> models;
    std::map<std::string, std::string> checksums;
};

} // namespace test
