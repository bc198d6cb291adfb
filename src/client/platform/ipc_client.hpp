#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Sends one newline-delimited JSON request and reads the reply.
class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const nlohmann::json& cmd) = 0;
    // timeout_ms < 0 waits indefinitely.
    virtual bool recv(nlohmann::json& response, int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
