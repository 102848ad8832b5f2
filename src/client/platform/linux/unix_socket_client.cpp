#include "platform/linux/unix_socket_client.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketClient::UnixSocketClient(size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

UnixSocketClient::~UnixSocketClient() {
    close();
}

bool UnixSocketClient::connect(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) return false;
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) return false;

    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    return true;
}

bool UnixSocketClient::send(const ClientMessage& message) {
    if (fd_ < 0) return false;

    auto frame = wire::encode(message);
    size_t sent = 0;
    while (sent < frame.size()) {
        ssize_t n = ::send(fd_, frame.data() + sent, frame.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

std::expected<DaemonMessage, wire::Error> UnixSocketClient::recv(int timeout_ms) {
    if (fd_ < 0) {
        return std::unexpected(wire::Error{wire::ErrorKind::Io, "not connected"});
    }

    wire::ReadFn read = [this, timeout_ms](std::span<uint8_t> buf)
        -> std::expected<size_t, wire::Error> {
        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        for (;;) {
            int ret = ::poll(&pfd, 1, timeout_ms);
            if (ret < 0 && errno == EINTR) continue;
            if (ret == 0) {
                return std::unexpected(wire::Error{wire::ErrorKind::Io,
                    std::format("no response within {} ms", timeout_ms)});
            }
            if (ret < 0) {
                return std::unexpected(wire::Error{wire::ErrorKind::Io, std::strerror(errno)});
            }

            ssize_t n = ::recv(fd_, buf.data(), buf.size(), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) {
                return std::unexpected(wire::Error{wire::ErrorKind::Io, std::strerror(errno)});
            }
            return static_cast<size_t>(n);
        }
    };

    return wire::read_message<DaemonMessage>(read, max_frame_bytes_);
}

std::expected<DaemonMessage, wire::Error>
UnixSocketClient::request(const ClientMessage& message, int timeout_ms) {
    if (!send(message)) {
        return std::unexpected(wire::Error{wire::ErrorKind::Io, "failed to send request"});
    }
    return recv(timeout_ms);
}

void UnixSocketClient::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}
