#pragma once

#include "protocol/wire_codec.hpp"

#include <expected>
#include <optional>
#include <string>

class IpcServer {
public:
    using ReadResult = std::expected<std::optional<ClientMessage>, wire::Error>;

    virtual ~IpcServer() = default;
    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // Reads available bytes from the client and returns the next complete
    // message, std::nullopt if more bytes are needed, or the error that
    // ends the connection (Closed on a clean disconnect).
    virtual ReadResult read_message(int client_fd) = 0;

    // Next complete message already buffered for the client, without reading.
    virtual ReadResult next_buffered(int client_fd) = 0;

    // Queues the encoded message and writes as much as the socket accepts
    // without blocking. False only when the connection is broken.
    virtual bool send_message(int client_fd, const DaemonMessage& message) = 0;

    // Writes queued output. With timeout_ms > 0 waits for the socket to
    // drain; otherwise returns as soon as the socket would block.
    virtual bool flush(int client_fd, int timeout_ms = 0) = 0;
    virtual bool has_pending_output(int client_fd) const = 0;

    virtual void close_client(int client_fd) = 0;
};
