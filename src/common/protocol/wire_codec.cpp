#include "protocol/wire_codec.hpp"

#include <format>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace wire {

namespace {

uint32_t read_le32(const uint8_t* p) {
    return uint32_t(p[0]) | uint32_t(p[1]) << 8 | uint32_t(p[2]) << 16 | uint32_t(p[3]) << 24;
}

std::vector<uint8_t> frame(const json& value) {
    auto payload = json::to_msgpack(value);
    if (payload.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("message exceeds 4 GiB frame limit");
    }

    auto len = static_cast<uint32_t>(payload.size());
    std::vector<uint8_t> out;
    out.reserve(header_size + payload.size());
    out.push_back(static_cast<uint8_t>(len));
    out.push_back(static_cast<uint8_t>(len >> 8));
    out.push_back(static_cast<uint8_t>(len >> 16));
    out.push_back(static_cast<uint8_t>(len >> 24));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

template <typename T, typename Fn>
std::expected<T, Error> parse_payload(std::span<const uint8_t> payload, Fn from_value) {
    try {
        auto value = json::from_msgpack(payload.begin(), payload.end());
        return from_value(value);
    } catch (const json::exception& e) {
        return std::unexpected(Error{ErrorKind::Malformed, e.what()});
    } catch (const ProtocolError& e) {
        return std::unexpected(Error{ErrorKind::Malformed, e.what()});
    }
}

// Reads until `buf` is full or the stream ends. Returns bytes read.
std::expected<size_t, Error> read_exact(const ReadFn& read, std::span<uint8_t> buf) {
    size_t got = 0;
    while (got < buf.size()) {
        auto n = read(buf.subspan(got));
        if (!n) return std::unexpected(n.error());
        if (*n == 0) break;
        got += *n;
    }
    return got;
}

} // namespace

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Closed: return "closed";
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::Malformed: return "malformed";
        case ErrorKind::TooLarge: return "too large";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

std::vector<uint8_t> encode(const ClientMessage& message) {
    return frame(to_value(message));
}

std::vector<uint8_t> encode(const DaemonMessage& message) {
    return frame(to_value(message));
}

std::expected<ClientMessage, Error> decode_client_payload(std::span<const uint8_t> payload) {
    return parse_payload<ClientMessage>(payload, client_message_from_value);
}

std::expected<DaemonMessage, Error> decode_daemon_payload(std::span<const uint8_t> payload) {
    return parse_payload<DaemonMessage>(payload, daemon_message_from_value);
}

std::expected<std::vector<uint8_t>, Error>
read_frame(const ReadFn& read, size_t max_frame_bytes) {
    uint8_t header[header_size];
    auto got = read_exact(read, header);
    if (!got) return std::unexpected(got.error());
    if (*got == 0) {
        return std::unexpected(Error{ErrorKind::Closed, "end of stream"});
    }
    if (*got < header_size) {
        return std::unexpected(Error{ErrorKind::Truncated,
            std::format("stream closed after {} of {} header bytes", *got, header_size)});
    }

    size_t len = read_le32(header);
    if (len > max_frame_bytes) {
        return std::unexpected(Error{ErrorKind::TooLarge,
            std::format("frame of {} bytes exceeds limit of {}", len, max_frame_bytes)});
    }

    std::vector<uint8_t> payload(len);
    got = read_exact(read, payload);
    if (!got) return std::unexpected(got.error());
    if (*got < len) {
        return std::unexpected(Error{ErrorKind::Truncated,
            std::format("stream closed after {} of {} payload bytes", *got, len)});
    }
    return payload;
}

void FrameReader::feed(std::span<const uint8_t> bytes) {
    // Compact once the consumed prefix dominates the buffer.
    if (pos_ > 0 && pos_ >= buf_.size() / 2) {
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos_));
        pos_ = 0;
    }
    buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

std::expected<std::optional<std::vector<uint8_t>>, Error> FrameReader::next() {
    if (buffered() < header_size) return std::nullopt;

    const uint8_t* start = buf_.data() + pos_;
    size_t len = read_le32(start);
    if (len > max_frame_bytes_) {
        return std::unexpected(Error{ErrorKind::TooLarge,
            std::format("frame of {} bytes exceeds limit of {}", len, max_frame_bytes_)});
    }
    if (buffered() < header_size + len) return std::nullopt;

    std::vector<uint8_t> payload(start + header_size, start + header_size + len);
    pos_ += header_size + len;
    if (pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    }
    return payload;
}

std::expected<void, Error> FrameReader::finish() const {
    if (buffered() == 0) return {};
    return std::unexpected(Error{ErrorKind::Truncated,
        std::format("stream closed with {} bytes of an incomplete frame", buffered())});
}

} // namespace wire
