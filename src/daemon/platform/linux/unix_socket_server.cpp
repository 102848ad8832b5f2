#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer(size_t max_frame_bytes)
    : max_frame_bytes_(max_frame_bytes) {}

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", socket_path);
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    // Remove stale socket
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind() failed: {}", std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    socket_path_ = socket_path;

    if (::listen(server_fd_, SOMAXCONN) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

    return true;
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
    if (fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::println(stderr, "ipc: accept4() failed: {}", std::strerror(errno));
        }
        return -1;
    }
    clients_.push_back({fd, wire::FrameReader(max_frame_bytes_)});
    return fd;
}

IpcServer::ReadResult UnixSocketServer::read_message(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) {
        return std::unexpected(wire::Error{wire::ErrorKind::Io, "unknown client"});
    }

    if (!client->eof) {
        uint8_t buf[65536];
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return pop(*client);
            }
            return std::unexpected(wire::Error{wire::ErrorKind::Io, std::strerror(errno)});
        }
        if (n == 0) {
            client->eof = true;
        } else {
            client->reader.feed(std::span<const uint8_t>(buf, static_cast<size_t>(n)));
        }
    }

    return pop(*client);
}

IpcServer::ReadResult UnixSocketServer::next_buffered(int client_fd) {
    auto* client = find_client(client_fd);
    if (!client) {
        return std::unexpected(wire::Error{wire::ErrorKind::Io, "unknown client"});
    }
    return pop(*client);
}

IpcServer::ReadResult UnixSocketServer::pop(ClientBuffer& client) {
    auto payload = client.reader.next();
    if (!payload) return std::unexpected(payload.error());

    if (!*payload) {
        if (!client.eof) return std::nullopt;
        // Peer closed: a clean close between frames, or mid-frame.
        if (auto done = client.reader.finish(); !done) {
            return std::unexpected(done.error());
        }
        return std::unexpected(wire::Error{wire::ErrorKind::Closed, "peer closed connection"});
    }

    auto message = wire::decode_client_payload(**payload);
    if (!message) return std::unexpected(message.error());
    return std::optional<ClientMessage>(std::move(*message));
}

bool UnixSocketServer::send_message(int client_fd, const DaemonMessage& message) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    auto frame = wire::encode(message);
    client->outbox.insert(client->outbox.end(), frame.begin(), frame.end());
    return write_pending(*client);
}

bool UnixSocketServer::flush(int client_fd, int timeout_ms) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    while (true) {
        if (!write_pending(*client)) return false;
        if (client->out_pos == client->outbox.size() || timeout_ms <= 0) return true;

        pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
        int ready = ::poll(&pfd, 1, timeout_ms);
        if (ready < 0 && errno == EINTR) continue;
        if (ready <= 0) {
            std::println(stderr, "ipc: send timed out on fd {}", client_fd);
            return false;
        }
    }
}

bool UnixSocketServer::has_pending_output(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && client->out_pos < client->outbox.size();
}

bool UnixSocketServer::write_pending(ClientBuffer& client) {
    while (client.out_pos < client.outbox.size()) {
        ssize_t n = ::send(client.fd, client.outbox.data() + client.out_pos,
                           client.outbox.size() - client.out_pos, MSG_NOSIGNAL | MSG_DONTWAIT);
        if (n > 0) {
            client.out_pos += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
        std::println(stderr, "ipc: send() failed: {}", std::strerror(errno));
        return false;
    }
    client.outbox.clear();
    client.out_pos = 0;
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

const UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) const {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
