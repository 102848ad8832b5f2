#include "protocol/session_id.hpp"

#include <algorithm>
#include <random>

namespace {

constexpr char hex_digits[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_dash_position(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

} // namespace

SessionId SessionId::generate() {
    thread_local std::mt19937_64 rng([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());

    std::array<uint8_t, size> bytes{};
    for (size_t half = 0; half < 2; ++half) {
        uint64_t v = rng();
        for (size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(v >> (i * 8));
        }
    }

    // RFC 4122: version 4, variant 10xx
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
    return SessionId(bytes);
}

std::optional<SessionId> SessionId::parse(std::string_view text) {
    if (text.size() != 36) return std::nullopt;

    std::array<uint8_t, size> bytes{};
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (is_dash_position(i)) {
            if (text[i] != '-') return std::nullopt;
            ++i;
            continue;
        }
        int hi = hex_value(text[i]);
        int lo = hex_value(text[i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return SessionId(bytes);
}

bool SessionId::is_nil() const {
    return std::ranges::all_of(bytes_, [](uint8_t b) { return b == 0; });
}

std::string SessionId::to_string() const {
    std::string s;
    s.reserve(36);
    for (size_t i = 0; i < size; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
        s.push_back(hex_digits[bytes_[i] >> 4]);
        s.push_back(hex_digits[bytes_[i] & 0x0F]);
    }
    return s;
}
