#pragma once

#include "backend.hpp"
#include "cloud_backend.hpp"
#include "jobs/backend_selector.hpp"

#include <memory>
#include <string>

class BackendFactory {
public:
    virtual ~BackendFactory() = default;
    virtual std::unique_ptr<TranscriptionBackend> create(Strategy strategy,
                                                         const SelectorConfig& cfg) = 0;
};

struct ServerEndpoints {
    std::string local_url = "http://127.0.0.1:8080";
    std::string fallback_url = "http://127.0.0.1:8081";
    std::string api_format = "whisper.cpp";
    long timeout_s = 600;
};

// Builds HTTP backends: the local whisper.cpp servers for Local and Fallback, and the
// cloud APIs with the key taken from the selector snapshot.
class HttpBackendFactory : public BackendFactory {
public:
    HttpBackendFactory(ServerEndpoints endpoints, CloudOptions cloud_defaults = {});

    std::unique_ptr<TranscriptionBackend> create(Strategy strategy,
                                                 const SelectorConfig& cfg) override;

private:
    ServerEndpoints endpoints_;
    CloudOptions cloud_defaults_;
};
