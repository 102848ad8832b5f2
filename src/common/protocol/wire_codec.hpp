#pragma once

#include "protocol/messages.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

// Length-prefixed MessagePack framing:
//   [u32 little-endian payload length][payload]
namespace wire {

inline constexpr size_t header_size = 4;
inline constexpr size_t default_max_frame_bytes = 64 * 1024 * 1024;

enum class ErrorKind {
    Closed,    // stream ended cleanly before a frame started
    Truncated, // stream ended inside a frame
    Malformed, // complete frame, payload did not deserialize
    TooLarge,  // declared length exceeds the frame cap
    Io,
};

struct Error {
    ErrorKind kind;
    std::string message;
};

std::string_view to_string(ErrorKind kind);

std::vector<uint8_t> encode(const ClientMessage& message);
std::vector<uint8_t> encode(const DaemonMessage& message);

std::expected<ClientMessage, Error> decode_client_payload(std::span<const uint8_t> payload);
std::expected<DaemonMessage, Error> decode_daemon_payload(std::span<const uint8_t> payload);

template <typename T>
std::expected<T, Error> decode_payload(std::span<const uint8_t> payload) {
    static_assert(std::is_same_v<T, ClientMessage> || std::is_same_v<T, DaemonMessage>);
    if constexpr (std::is_same_v<T, ClientMessage>) {
        return decode_client_payload(payload);
    } else {
        return decode_daemon_payload(payload);
    }
}

// Fills as much of `buf` as is available. Returns 0 at end of stream.
using ReadFn = std::function<std::expected<size_t, Error>(std::span<uint8_t> buf)>;

// Reads exactly one frame and returns its payload.
std::expected<std::vector<uint8_t>, Error>
    read_frame(const ReadFn& read, size_t max_frame_bytes = default_max_frame_bytes);

template <typename T>
std::expected<T, Error> read_message(const ReadFn& read,
                                     size_t max_frame_bytes = default_max_frame_bytes) {
    auto payload = read_frame(read, max_frame_bytes);
    if (!payload) return std::unexpected(payload.error());
    return decode_payload<T>(*payload);
}

// Decodes the first frame of an in-memory byte stream.
template <typename T>
std::expected<T, Error> decode(std::span<const uint8_t> stream,
                               size_t max_frame_bytes = default_max_frame_bytes) {
    size_t pos = 0;
    ReadFn read = [&stream, &pos](std::span<uint8_t> buf) -> std::expected<size_t, Error> {
        size_t n = std::min(buf.size(), stream.size() - pos);
        if (n > 0) std::memcpy(buf.data(), stream.data() + pos, n);
        pos += n;
        return n;
    };
    return read_message<T>(read, max_frame_bytes);
}

// Incremental frame reassembly for non-blocking sockets.
class FrameReader {
public:
    explicit FrameReader(size_t max_frame_bytes = default_max_frame_bytes)
        : max_frame_bytes_(max_frame_bytes) {}

    void feed(std::span<const uint8_t> bytes);

    // Pops the next complete payload, or std::nullopt if more bytes are needed.
    std::expected<std::optional<std::vector<uint8_t>>, Error> next();

    // To be called at end of stream: fails with Truncated if a partial frame is pending.
    std::expected<void, Error> finish() const;

    size_t buffered() const { return buf_.size() - pos_; }

private:
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
    size_t max_frame_bytes_;
};

} // namespace wire
