#pragma once
#include "packet/errc.hpp"

#include <array>
#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace fdp
{

/**
 * Opaque 16-byte conversation token.
 * Value type with no mutators: once built it never changes.
 */
class SessionId
{
public:
    static constexpr size_t size = 16;
    using bytes_t = std::array<std::byte, size>;

    SessionId() = default;
    explicit SessionId(const bytes_t& raw) : id(raw) {}

    [[nodiscard]] static std::expected<SessionId, errc> from_bytes(std::span<const std::byte> data);
    [[nodiscard]] static std::optional<SessionId> from_hex(std::string_view hex);
    [[nodiscard]] static std::expected<SessionId, std::string> generate();

    [[nodiscard]] const bytes_t& bytes() const { return id; }
    [[nodiscard]] std::string to_hex() const;

    bool operator==(const SessionId&) const = default;

private:
    bytes_t id{};
};

} // namespace fdp

template<>
struct std::formatter<fdp::SessionId> : std::formatter<std::string_view>
{
    auto format(const fdp::SessionId& sid, std::format_context& fc) const
    {
        return std::formatter<std::string_view>::format(sid.to_hex(), fc);
    }
};
