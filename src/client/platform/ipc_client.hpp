#pragma once

#include "protocol/wire_codec.hpp"

#include <expected>
#include <string>

class IpcClient {
public:
    virtual ~IpcClient() = default;
    virtual bool connect(const std::string& endpoint) = 0;
    virtual bool send(const ClientMessage& message) = 0;
    virtual std::expected<DaemonMessage, wire::Error> recv(int timeout_ms = 30000) = 0;
    virtual void close() = 0;
};
