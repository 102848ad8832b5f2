#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Random (version 4) UUID identifying one recording session.
class SessionId {
public:
    static constexpr size_t size = 16;

    SessionId() = default;
    explicit SessionId(const std::array<uint8_t, size>& bytes) : bytes_(bytes) {}

    static SessionId generate();

    // Accepts the canonical 8-4-4-4-12 hex form.
    static std::optional<SessionId> parse(std::string_view text);

    const std::array<uint8_t, size>& bytes() const { return bytes_; }
    bool is_nil() const;
    std::string to_string() const;

    auto operator<=>(const SessionId&) const = default;

private:
    std::array<uint8_t, size> bytes_{};
};
