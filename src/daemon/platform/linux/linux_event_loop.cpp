#include "platform/linux/linux_event_loop.hpp"

#include "engine/engine_factory.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <print>
#include <string>
#include <pthread.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose,
                               std::unique_ptr<SpeechEngine> engine)
    : config_(std::move(config)), verbose_(verbose),
      ipc_server_(config_.ipc.max_frame_bytes), engine_(std::move(engine)) {}

LinuxEventLoop::~LinuxEventLoop() {
    // Workers may still post completions; let them finish first.
    if (workers_) workers_->shutdown();
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    // Block the shutdown signals before any thread exists; they are read
    // from a signalfd instead.
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &mask, nullptr) != 0) {
        std::println(stderr, "pthread_sigmask failed");
        return false;
    }
    workers_ = std::make_unique<WorkerPool>(config_.daemon.workers);

    // Speech engine and model manager
    auto engine = engine_ ? std::move(engine_) : make_speech_engine(config_.model);
    if (!engine) {
        std::println(stderr, "model: unknown or unavailable engine: {}", config_.model.engine);
        return false;
    }
    model_ = std::make_unique<ModelManager>(std::move(engine), config_.model.path,
                                            config_.model.language);
    core_ = std::make_unique<DaemonCore>(config_, verbose_, registry_, *model_,
                                         [this]() { shutdown_now(); });
    log("Engine '" + config_.model.engine + "', model " + config_.model.path);

    // IPC socket
    auto ipc_path = config_.ipc.endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Worker completion eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Idle check timer
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    time_t interval = std::max<time_t>(config_.daemon.idle_check_seconds, 1);
    itimerspec tick{.it_interval = {interval, 0}, .it_value = {interval, 0}};
    if (timerfd_settime(timer_fd_, 0, &tick, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_) || !add_fd(ipc_server_.server_fd()) ||
        !add_fd(worker_event_fd_) || !add_fd(timer_fd_)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 32;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::string("Received ") + strsignal(static_cast<int>(info.ssi_signo)) +
                        ", shutting down");
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                accept_clients();
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
                    std::println(stderr, "eventfd read failed: {}", std::strerror(errno));
                }
                drain_completions();
                continue;
            }

            if (fd == timer_fd_) {
                on_timer();
                continue;
            }

            // Client fd; may have been dropped earlier in this batch.
            auto it = connections_.find(fd);
            if (it == connections_.end()) continue;
            if (ipc_server_.has_pending_output(fd)) {
                if (events[i].events & (EPOLLERR | EPOLLHUP)) {
                    drop_client(fd);
                } else {
                    flush_client(fd);
                }
                continue;
            }
            if (it->second.busy) {
                // Disarmed fds only report hangup or error.
                drop_client(fd);
                continue;
            }
            handle_client(fd);
        }
    }

    // Clean shutdown: in-flight requests finish and their replies go out.
    log("Waiting for in-flight requests");
    workers_->shutdown();
    drain_completions();
    flush_all();
    ipc_server_.stop();
    connections_.clear();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    if (worker_event_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::accept_clients() {
    for (;;) {
        int client_fd = ipc_server_.accept_client();
        if (client_fd < 0) return;

        epoll_event ev{.events = EPOLLIN | EPOLLRDHUP, .data = {.fd = client_fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
            std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
            ipc_server_.close_client(client_fd);
            continue;
        }
        connections_[client_fd] = Connection{.id = next_conn_id_++};
    }
}

void LinuxEventLoop::handle_client(int fd) {
    process(fd, ipc_server_.read_message(fd));
}

void LinuxEventLoop::process(int fd, IpcServer::ReadResult next) {
    while (true) {
        if (!next) {
            const auto& err = next.error();
            if (err.kind != wire::ErrorKind::Closed) {
                std::println(stderr, "ipc: dropping client fd {}: {} ({})", fd,
                             wire::to_string(err.kind), err.message);
            }
            drop_client(fd);
            return;
        }
        if (!*next) return; // wait for more bytes

        ClientMessage message = std::move(**next);
        if (DaemonCore::is_blocking(message)) {
            dispatch_blocking(fd, std::move(message));
            return;
        }

        auto response = core_->handle_message(message);
        if (response && !reply(fd, *response)) return;

        next = ipc_server_.next_buffered(fd);
    }
}

// False when the client was dropped or its reply is still queued; either
// way no further requests from it are handled now.
bool LinuxEventLoop::reply(int fd, const DaemonMessage& message) {
    if (!ipc_server_.send_message(fd, message)) {
        drop_client(fd);
        return false;
    }
    if (!ipc_server_.has_pending_output(fd)) return true;

    if (!update_interest(fd)) drop_client(fd);
    return false;
}

void LinuxEventLoop::flush_client(int fd) {
    if (!ipc_server_.flush(fd)) {
        drop_client(fd);
        return;
    }
    if (ipc_server_.has_pending_output(fd)) return;

    if (!update_interest(fd)) {
        drop_client(fd);
        return;
    }
    if (!running_.load(std::memory_order_relaxed)) return;
    if (connections_.at(fd).busy) return;
    process(fd, ipc_server_.next_buffered(fd));
}

void LinuxEventLoop::dispatch_blocking(int fd, ClientMessage message) {
    auto& conn = connections_.at(fd);
    conn.busy = true;
    if (!update_interest(fd)) {
        drop_client(fd);
        return;
    }

    bool queued = workers_->submit([this, fd, conn_id = conn.id, message = std::move(message)] {
        auto response = core_->handle_message(message);
        {
            std::lock_guard lock(completions_mutex_);
            completions_.push_back({fd, conn_id, std::move(response)});
        }
        uint64_t val = 1;
        if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
            std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
        }
    });

    if (!queued) {
        drop_client(fd);
    }
}

void LinuxEventLoop::drain_completions() {
    std::vector<Completion> done;
    {
        std::lock_guard lock(completions_mutex_);
        done.swap(completions_);
    }

    for (auto& c : done) {
        // The client may have gone away, and its fd been reused, meanwhile.
        auto it = connections_.find(c.fd);
        if (it == connections_.end() || it->second.id != c.conn_id) {
            log("Dropping reply for a disconnected client");
            continue;
        }
        it->second.busy = false;

        if (c.response && !reply(c.fd, *c.response)) continue;
        if (!running_.load(std::memory_order_relaxed)) continue;

        if (!update_interest(c.fd)) {
            drop_client(c.fd);
            continue;
        }
        process(c.fd, ipc_server_.next_buffered(c.fd));
    }
}

// Last chance for queued replies before the sockets close.
void LinuxEventLoop::flush_all() {
    int timeout_ms = static_cast<int>(std::max<uint32_t>(config_.ipc.timeout_seconds, 1)) * 1000;
    for (const auto& [fd, conn] : connections_) {
        if (!ipc_server_.has_pending_output(fd)) continue;
        if (!ipc_server_.flush(fd, timeout_ms)) {
            log("Undelivered reply for connection " + std::to_string(conn.id));
        }
    }
}

void LinuxEventLoop::drop_client(int fd) {
    epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
    ipc_server_.close_client(fd);
    connections_.erase(fd);
}

// Queued output waits for EPOLLOUT, a busy client waits for its worker,
// anything else waits for requests.
bool LinuxEventLoop::update_interest(int fd) {
    uint32_t events = 0;
    if (ipc_server_.has_pending_output(fd)) {
        events = EPOLLOUT;
    } else if (!connections_.at(fd).busy) {
        events = EPOLLIN | EPOLLRDHUP;
    }
    epoll_event ev{.events = events, .data = {.fd = fd}};
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd, &ev) == 0) return true;
    std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
    return false;
}

void LinuxEventLoop::on_timer() {
    uint64_t expirations;
    if (::read(timer_fd_, &expirations, sizeof(expirations)) < 0) return;
    core_->on_idle_tick();
}

void LinuxEventLoop::shutdown_now() {
    log("Exiting");
    ipc_server_.stop();
    // Workers may be mid-inference; static destructors must not run under them.
    std::quick_exit(EXIT_SUCCESS);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dictation] {}", msg);
    }
}
