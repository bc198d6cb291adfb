#include "live_session.hpp"
#include "jobs/job_orchestrator.hpp"
#include "storage/atomic_file.hpp"
#include "wav_encoder.hpp"
#include "whisper/http.hpp"
#include "whisper/transcript_text.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

std::string_view to_string(LiveState s) {
    switch (s) {
        case LiveState::Idle: return "idle";
        case LiveState::Streaming: return "streaming";
        case LiveState::Stopping: return "stopping";
    }
    return "unknown";
}

LiveSession::LiveSession(AudioCapture& capture, RingBuffer& ring_buf, CaptureStatus& status,
                         const ModelCatalog& catalog, EngineFactory factory,
                         LiveOptions options, JobOrchestrator* jobs, bool verbose)
    : capture_(capture), ring_buf_(ring_buf), status_(status), catalog_(catalog),
      factory_(std::move(factory)), options_(std::move(options)), jobs_(jobs),
      verbose_(verbose) {}

LiveSession::~LiveSession() {
    stop();
}

std::expected<LiveBackend, std::string> LiveSession::start() {
    LiveBackend requested;
    {
        std::lock_guard lock(mtx_);
        if (state_ != LiveState::Idle) return std::unexpected("live session already running");
        requested = backend_;
    }
    if (status_.is_recording()) {
        return std::unexpected("audio capture is busy with a recording");
    }

    std::unique_ptr<StreamingEngine> engine;
    std::optional<LiveBackend> chosen;
    StreamingCallbacks callbacks{
        .on_partial = [this](const std::string& t) { on_partial(t); },
        .on_final = [this](const std::string& t) { on_final(t); },
        .on_error = [this](const std::string& m) { on_error(m); },
    };

    for (auto candidate : select_streaming(requested, catalog_)) {
        engine = factory_ ? factory_(candidate) : nullptr;
        if (engine && engine->start(callbacks)) {
            chosen = candidate;
            break;
        }
        log(std::format("live: {} unavailable", to_string(candidate)));
        engine.reset();
    }
    if (!chosen) {
        return std::unexpected("no streaming backend available");
    }

    {
        std::lock_guard lock(mtx_);
        final_.clear();
        partial_.clear();
        last_error_.reset();
        audio_.clear();
    }

    ring_buf_.reset();
    if (!capture_.start()) {
        engine->stop();
        std::println(stderr, "live: failed to start audio capture");
        return std::unexpected("failed to start audio capture");
    }

    {
        std::lock_guard lock(mtx_);
        engine_ = std::move(engine);
        active_ = chosen;
        state_ = LiveState::Streaming;
    }
    status_.set_live(std::string(to_string(*chosen)));
    pump_ = std::jthread([this](std::stop_token st) { pump(st); });

    if (*chosen != requested) {
        log(std::format("live: {} unavailable, streaming with {}", to_string(requested),
                        to_string(*chosen)));
    } else {
        log(std::format("live: streaming with {}", to_string(*chosen)));
    }
    return *chosen;
}

void LiveSession::stop() {
    {
        std::lock_guard lock(mtx_);
        if (state_ != LiveState::Streaming) return;
        state_ = LiveState::Stopping;
    }

    if (pump_.joinable()) {
        pump_.request_stop();
        pump_.join();
    }
    capture_.stop();
    if (engine_) engine_->stop();
    drain_ring();

    {
        std::lock_guard lock(mtx_);
        if (!partial_.empty()) {
            if (!final_.empty()) final_ += ' ';
            final_ += partial_;
            partial_.clear();
        }
        engine_.reset();
        active_.reset();
        state_ = LiveState::Idle;
    }
    status_.set_live(std::nullopt);
    log("live: stopped");
}

void LiveSession::switch_backend(LiveBackend backend) {
    std::lock_guard lock(mtx_);
    if (state_ != LiveState::Idle) {
        throw LiveSessionError("cannot switch live backend while streaming");
    }
    backend_ = backend;
}

std::expected<LiveSaveResult, std::string> LiveSession::save() {
    std::string text;
    std::vector<int16_t> audio;
    {
        std::lock_guard lock(mtx_);
        auto now = std::chrono::steady_clock::now();
        if (last_save_ && now - *last_save_ < options_.save_interval) {
            return std::unexpected("save rate limited, try again shortly");
        }
        text = final_;
        if (!partial_.empty()) {
            if (!text.empty()) text += ' ';
            text += partial_;
        }
        if (text.empty()) return std::unexpected("nothing to save");
        audio = audio_;
        last_save_ = now;
    }

    std::error_code ec;
    fs::create_directories(options_.recordings_dir, ec);
    if (ec) {
        return std::unexpected("cannot create " + options_.recordings_dir + ": " + ec.message());
    }

    auto base = "Live-" + file_timestamp();
    LiveSaveResult out;
    out.text_path = (fs::path(options_.recordings_dir) / (base + ".txt")).string();
    if (auto r = atomic_write(out.text_path, text + "\n"); !r) {
        std::println(stderr, "live: {}", r.error());
        return std::unexpected(r.error());
    }

    if (!audio.empty()) {
        auto wav_path = (fs::path(options_.recordings_dir) / (base + ".wav")).string();
        auto wav_data = wav::encode(audio, capture_.sample_rate());
        if (auto r = atomic_write(wav_path, std::span<const uint8_t>(wav_data)); !r) {
            std::println(stderr, "live: {}", r.error());
        } else {
            out.audio_path = wav_path;
        }
    }

    if (jobs_ && out.audio_path) {
        double duration = static_cast<double>(audio.size()) / capture_.sample_rate();
        TranscriptionResult result{
            .text = text,
            .segments = segments_from_text(text, duration),
            .language = std::nullopt,
            .duration = duration,
        };
        out.job_id = jobs_->add_completed(*out.audio_path, base + ".wav", std::move(result));
    }

    log(std::format("live: saved {}", out.text_path));
    return out;
}

LiveState LiveSession::state() const {
    std::lock_guard lock(mtx_);
    return state_;
}

LiveBackend LiveSession::backend() const {
    std::lock_guard lock(mtx_);
    return backend_;
}

std::optional<LiveBackend> LiveSession::active_backend() const {
    std::lock_guard lock(mtx_);
    return active_;
}

std::string LiveSession::final_text() const {
    std::lock_guard lock(mtx_);
    return final_;
}

std::string LiveSession::partial_text() const {
    std::lock_guard lock(mtx_);
    return partial_;
}

std::string LiveSession::combined_text() const {
    std::lock_guard lock(mtx_);
    if (final_.empty()) return partial_;
    if (partial_.empty()) return final_;
    return final_ + " " + partial_;
}

std::optional<std::string> LiveSession::last_error() const {
    std::lock_guard lock(mtx_);
    return last_error_;
}

double LiveSession::captured_seconds() const {
    std::lock_guard lock(mtx_);
    return static_cast<double>(audio_.size()) / capture_.sample_rate();
}

void LiveSession::pump(std::stop_token stop) {
    while (!stop.stop_requested()) {
        interruptible_sleep(options_.pump_interval, stop);
        drain_ring();
    }
}

void LiveSession::drain_ring() {
    std::vector<int16_t> chunk;
    ring_buf_.drain_into(chunk, ring_buf_.available() / sizeof(int16_t));
    if (chunk.empty()) return;

    {
        std::lock_guard lock(mtx_);
        if (engine_ && state_ == LiveState::Streaming) engine_->feed(chunk);

        audio_.insert(audio_.end(), chunk.begin(), chunk.end());
        auto limit = static_cast<size_t>(options_.max_audio_seconds * capture_.sample_rate());
        if (audio_.size() > limit) {
            audio_.erase(audio_.begin(),
                         audio_.begin() + static_cast<std::ptrdiff_t>(audio_.size() - limit));
        }
    }
}

void LiveSession::on_partial(const std::string& text) {
    auto clean = strip_markup(text);
    std::lock_guard lock(mtx_);
    partial_ = std::move(clean);
}

void LiveSession::on_final(const std::string& text) {
    auto clean = strip_markup(text);
    std::lock_guard lock(mtx_);
    if (!clean.empty()) {
        if (!final_.empty()) final_ += ' ';
        final_ += clean;
    }
    partial_.clear();
}

void LiveSession::on_error(const std::string& message) {
    std::println(stderr, "live: {}", message);
    std::lock_guard lock(mtx_);
    last_error_ = message;
}

void LiveSession::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-control] {}", msg);
    }
}
