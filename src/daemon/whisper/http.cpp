#include "http.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void ensure_curl_global() {
    static CurlGlobal global;
}

} // namespace

CurlRequest::CurlRequest() {
    ensure_curl_global();
    curl_ = curl_easy_init();
}

CurlRequest::~CurlRequest() {
    if (mime_) curl_mime_free(mime_);
    if (headers_) curl_slist_free_all(headers_);
    if (curl_) curl_easy_cleanup(curl_);
}

void CurlRequest::add_header(const std::string& header) {
    headers_ = curl_slist_append(headers_, header.c_str());
}

void CurlRequest::set_json_body(std::string body) {
    json_body_ = std::move(body);
    add_header("Content-Type: application/json");
}

void CurlRequest::set_progress(const ProgressCallback* progress, double lo, double hi) {
    progress_ = progress;
    progress_lo_ = lo;
    progress_hi_ = hi;
}

size_t CurlRequest::on_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

int CurlRequest::on_xferinfo(void* userdata, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                             curl_off_t ultotal, curl_off_t ulnow) {
    auto* self = static_cast<CurlRequest*>(userdata);
    if (self->stop_.stop_requested()) return 1;

    if (self->progress_ && *self->progress_ && ultotal > 0) {
        double frac = static_cast<double>(ulnow) / static_cast<double>(ultotal);
        (*self->progress_)(self->progress_lo_ + frac * (self->progress_hi_ - self->progress_lo_));
    }
    return 0;
}

std::expected<HttpResponse, BackendFailure> CurlRequest::perform(const std::string& url,
                                                                 std::stop_token stop) {
    if (!curl_) {
        return std::unexpected(BackendFailure{FailureKind::Backend, "curl_easy_init failed"});
    }

    stop_ = std::move(stop);
    response_.clear();

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    if (mime_) {
        curl_easy_setopt(curl_, CURLOPT_MIMEPOST, mime_);
    } else if (!json_body_.empty()) {
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, json_body_.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body_.size()));
    }
    if (headers_) curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, on_write);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, on_xferinfo);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, this);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl_);
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(BackendFailure{FailureKind::Cancelled, "cancelled"});
    }
    if (res != CURLE_OK) {
        return std::unexpected(BackendFailure{
            FailureKind::Backend, std::string("curl error: ") + curl_easy_strerror(res)});
    }

    HttpResponse out;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &out.status);
    out.body = std::move(response_);
    return out;
}

void interruptible_sleep(std::chrono::milliseconds d, std::stop_token stop) {
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock(mtx);
    cv.wait_for(lock, stop, d, [] { return false; });
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    static constexpr char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(table[(v >> 18) & 0x3F]);
        out.push_back(table[(v >> 12) & 0x3F]);
        out.push_back(table[(v >> 6) & 0x3F]);
        out.push_back(table[v & 0x3F]);
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t v = uint32_t(data[i]) << 16;
        out.push_back(table[(v >> 18) & 0x3F]);
        out.push_back(table[(v >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(table[(v >> 18) & 0x3F]);
        out.push_back(table[(v >> 12) & 0x3F]);
        out.push_back(table[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string error_message_from_body(const std::string& body) {
    constexpr size_t kMaxBody = 200;
    auto raw = body.size() > kMaxBody ? body.substr(0, kMaxBody) + "..." : body;

    json j = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object() || !j.contains("error")) return raw;

    auto& e = j["error"];
    if (e.is_string()) return e.get<std::string>();
    if (e.is_object() && e.contains("message") && e["message"].is_string()) {
        return e["message"].get<std::string>();
    }
    return raw;
}
