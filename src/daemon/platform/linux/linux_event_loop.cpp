#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(config_.audio.ring_buffer_bytes()),
      audio_capture_(ring_buf_, config_.audio.sample_rate),
      core_(config_, verbose_, ring_buf_, audio_capture_, ipc_server_, connectivity_,
            // NotifyCallback, called from the job event dispatcher thread
            [this]() {
                uint64_t val = 1;
                if (::write(job_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (job_event_fd_ >= 0) ::close(job_event_fd_);
}

bool LinuxEventLoop::init() {
    // Needed before the core starts publishing job events.
    job_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (job_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (ledger, attempt db, orchestrator, recovery)
    if (!core_.init()) return false;

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            return false;
        }
        return true;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(job_event_fd_, EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int kMaxEvents = 16;
    epoll_event events[kMaxEvents];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, kMaxEvents, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }
        for (int i = 0; i < n && running_.load(std::memory_order_relaxed); i++) {
            dispatch(events[i].data.fd);
        }
    }

    core_.shutdown();
    ipc_server_.stop();
}

void LinuxEventLoop::dispatch(int fd) {
    if (fd == signal_fd_) {
        signalfd_siginfo info;
        if (::read(signal_fd_, &info, sizeof(info)) > 0) {
            log(std::format("Received signal {}, shutting down", info.ssi_signo));
        }
        request_stop();
    } else if (fd == ipc_server_.server_fd()) {
        accept_client();
    } else if (fd == job_event_fd_) {
        uint64_t pending;
        if (::read(job_event_fd_, &pending, sizeof(pending)) > 0) core_.on_job_events();
    } else {
        handle_client(fd);
    }
}

void LinuxEventLoop::accept_client() {
    int client_fd = ipc_server_.accept_client();
    if (client_fd < 0) return;

    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) != 0) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        ipc_server_.close_client(client_fd);
    }
}

void LinuxEventLoop::handle_client(int fd) {
    nlohmann::json cmd;
    // Drain every complete line the read produced.
    while (true) {
        switch (ipc_server_.read_command(fd, cmd)) {
            case ReadStatus::Pending:
                return;
            case ReadStatus::Closed:
                drop_client(fd);
                return;
            case ReadStatus::Invalid:
                ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid JSON"}});
                continue;
            case ReadStatus::Command:
                break;
        }

        std::string cmd_str = cmd.value("cmd", "");
        auto response = core_.handle_command(cmd_str, cmd);

        if (response.value("status", "") == "waiting") {
            core_.add_waiting_client(fd, response.value("id", ""));
        } else {
            ipc_server_.send_response(fd, response);
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    core_.remove_waiting_client(fd);
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-control] {}", msg);
    }
}
