#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "engine/speech_engine.hpp"
#include "model_manager.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "session_registry.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

class LinuxEventLoop {
public:
    // Without an engine, init() builds the one named in config.model.
    explicit LinuxEventLoop(Config config, bool verbose = false,
                            std::unique_ptr<SpeechEngine> engine = nullptr);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    struct Connection {
        uint64_t id;
        bool busy = false; // request on the worker pool, fd disarmed
    };

    struct Completion {
        int fd;
        uint64_t conn_id;
        std::optional<DaemonMessage> response;
    };

    void accept_clients();
    void handle_client(int fd);
    void process(int fd, IpcServer::ReadResult next);
    bool reply(int fd, const DaemonMessage& message);
    void flush_client(int fd);
    void dispatch_blocking(int fd, ClientMessage message);
    void drain_completions();
    void flush_all();
    void drop_client(int fd);
    bool update_interest(int fd);
    void on_timer();
    void shutdown_now();

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    UnixSocketServer ipc_server_;
    SessionRegistry registry_;
    std::unique_ptr<SpeechEngine> engine_;
    std::unique_ptr<ModelManager> model_;
    std::unique_ptr<DaemonCore> core_;
    // Created once SIGINT/SIGTERM are blocked so the threads inherit the mask.
    std::unique_ptr<WorkerPool> workers_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int worker_event_fd_ = -1;
    int timer_fd_ = -1;

    std::unordered_map<int, Connection> connections_;
    uint64_t next_conn_id_ = 1;

    std::mutex completions_mutex_;
    std::vector<Completion> completions_;

    std::atomic<bool> running_{false};
};
