#pragma once

#include "platform/ipc_client.hpp"

#include <cstddef>

class UnixSocketClient : public IpcClient {
public:
    explicit UnixSocketClient(size_t max_frame_bytes = wire::default_max_frame_bytes);
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const ClientMessage& message) override;
    std::expected<DaemonMessage, wire::Error> recv(int timeout_ms = 30000) override;
    void close() override;

    // Sends `message` and waits for the daemon's reply.
    std::expected<DaemonMessage, wire::Error> request(const ClientMessage& message,
                                                      int timeout_ms = 30000);

private:
    int fd_ = -1;
    size_t max_frame_bytes_;
};
