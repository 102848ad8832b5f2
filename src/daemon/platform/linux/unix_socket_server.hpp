#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    explicit UnixSocketServer(size_t max_frame_bytes = wire::default_max_frame_bytes);
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    ReadResult read_message(int client_fd) override;
    ReadResult next_buffered(int client_fd) override;
    bool send_message(int client_fd, const DaemonMessage& message) override;
    bool flush(int client_fd, int timeout_ms = 0) override;
    bool has_pending_output(int client_fd) const override;
    void close_client(int client_fd) override;

private:
    struct ClientBuffer {
        int fd;
        wire::FrameReader reader;
        bool eof = false;
        std::vector<uint8_t> outbox;
        size_t out_pos = 0;
    };

    ClientBuffer* find_client(int fd);
    const ClientBuffer* find_client(int fd) const;
    ReadResult pop(ClientBuffer& client);
    bool write_pending(ClientBuffer& client);

    size_t max_frame_bytes_;
    int server_fd_ = -1;
    std::string socket_path_;
    std::vector<ClientBuffer> clients_;
};
