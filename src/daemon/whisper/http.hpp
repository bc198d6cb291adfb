#pragma once

#include "whisper/backend.hpp"

#include <algorithm>
#include <chrono>
#include <curl/curl.h>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

struct HttpResponse {
    long status = 0;
    std::string body;
};

// One libcurl easy handle. Aborts the transfer once `stop` is requested and maps upload
// progress onto [progress_lo, progress_hi] of the caller's progress callback.
class CurlRequest {
public:
    CurlRequest();
    ~CurlRequest();

    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    bool valid() const { return curl_ != nullptr; }
    CURL* handle() { return curl_; }

    void add_header(const std::string& header);
    void set_mime(curl_mime* mime) { mime_ = mime; }
    void set_json_body(std::string body);
    void set_timeout(long timeout_s) { timeout_s_ = timeout_s; }
    void set_progress(const ProgressCallback* progress, double lo, double hi);

    std::expected<HttpResponse, BackendFailure> perform(const std::string& url,
                                                        std::stop_token stop);

private:
    static size_t on_write(char* ptr, size_t size, size_t nmemb, void* userdata);
    static int on_xferinfo(void* userdata, curl_off_t dltotal, curl_off_t dlnow,
                           curl_off_t ultotal, curl_off_t ulnow);

    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
    curl_mime* mime_ = nullptr;
    std::string json_body_;
    long timeout_s_ = 120;

    const ProgressCallback* progress_ = nullptr;
    double progress_lo_ = 0.0;
    double progress_hi_ = 0.0;
    std::stop_token stop_;
    std::string response_;
};

// Runs `attempt` until it succeeds, fails with anything other than a transport error, or
// `attempts` tries have been made. Waits `initial_delay` before the second try and doubles
// the wait each time; a stop request ends the wait early.
template <typename F>
std::expected<HttpResponse, BackendFailure>
with_retry(F&& attempt, int attempts, std::chrono::milliseconds initial_delay,
           std::stop_token stop);

void interruptible_sleep(std::chrono::milliseconds d, std::stop_token stop);

std::string base64_encode(const std::vector<uint8_t>& data);

// Human-readable message from an error payload of an OpenAI- or Gemini-style API.
std::string error_message_from_body(const std::string& body);

template <typename F>
std::expected<HttpResponse, BackendFailure>
with_retry(F&& attempt, int attempts, std::chrono::milliseconds initial_delay,
           std::stop_token stop) {
    auto delay = initial_delay;
    std::expected<HttpResponse, BackendFailure> res =
        std::unexpected(BackendFailure{FailureKind::Backend, "no attempt made"});

    for (int i = 0; i < std::max(attempts, 1); ++i) {
        if (i > 0) {
            interruptible_sleep(delay, stop);
            delay *= 2;
        }
        if (stop.stop_requested()) {
            return std::unexpected(BackendFailure{FailureKind::Cancelled, "cancelled"});
        }
        res = attempt();
        if (res || res.error().kind != FailureKind::Backend) return res;
    }
    return res;
}
