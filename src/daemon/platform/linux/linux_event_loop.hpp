#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/ifaddrs_connectivity.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "ring_buffer.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void dispatch(int fd);
    void accept_client();
    void handle_client(int fd);
    void drop_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Declared before core_, which holds references to them.
    RingBuffer ring_buf_;
    PipeWireCapture audio_capture_;
    UnixSocketServer ipc_server_;
    IfaddrsConnectivity connectivity_;

    DaemonCore core_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int job_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
