#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::memcpy(addr.sun_path, endpoint.data(), endpoint.size());

    // A previous daemon that died leaves its socket file behind.
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) return fail("socket");
    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return fail("bind");
    }
    socket_path_ = endpoint;

    if (::chmod(endpoint.c_str(), S_IRUSR | S_IWUSR) < 0) {
        std::println(stderr, "ipc: chmod() failed: {}", std::strerror(errno));
    }
    if (::listen(server_fd_, 8) < 0) return fail("listen");
    return true;
}

bool UnixSocketServer::fail(const char* call) {
    std::println(stderr, "ipc: {}() failed: {}", call, std::strerror(errno));
    stop();
    return false;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

ReadStatus UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return ReadStatus::Closed;

    // A previous read may have buffered more than one line.
    auto pos = client->buf.find('\n');
    if (pos == std::string::npos) {
        char buf[4096];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return ReadStatus::Pending;
        if (n <= 0) return ReadStatus::Closed;

        client->buf.append(buf, static_cast<size_t>(n));
        pos = client->buf.find('\n');
        if (pos == std::string::npos) {
            if (client->buf.size() > kMaxMessageBytes) {
                std::println(stderr, "ipc: client {} exceeded message size limit", client_fd);
                return ReadStatus::Closed;
            }
            return ReadStatus::Pending;
        }
    }

    std::string line = client->buf.substr(0, pos);
    client->buf.erase(0, pos + 1);

    cmd = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (cmd.is_discarded() || !cmd.is_object()) return ReadStatus::Invalid;
    return ReadStatus::Command;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;
    int stalls = 0;
    while (off < msg.size()) {
        ssize_t sent = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            // Client sockets are non-blocking; give a slow reader up to a second.
            if ((errno == EAGAIN || errno == EWOULDBLOCK) && ++stalls < 1000) {
                ::usleep(1000);
                continue;
            }
            return false;
        }
        off += static_cast<size_t>(sent);
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
