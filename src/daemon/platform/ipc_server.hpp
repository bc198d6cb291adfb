#pragma once

#include <nlohmann/json.hpp>
#include <string>

enum class ReadStatus {
    Command, // a complete message was parsed into `cmd`
    Pending, // partial message buffered, wait for more data
    Invalid, // a complete line that is not JSON; the client stays connected
    Closed,  // peer hung up or the connection failed
};

// Newline-delimited JSON request/response server, driven by the caller's event loop.
class IpcServer {
public:
    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;
    virtual ReadStatus read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
