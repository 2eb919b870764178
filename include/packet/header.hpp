#pragma once
#include "packet/errc.hpp"
#include "packet/flags.hpp"
#include "packet/protocol.hpp"
#include "packet/session_id.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <span>

namespace fdp
{

// Typed view over the 36 fixed header bytes
struct Header
{
    using bytes_t = std::array<std::byte, header_size>;

    uint8_t version = protocol_version;
    SessionId session_id;
    uint8_t intent = 0;
    uint8_t priority = 0;
    Flags flags;
    uint32_t sequence = 0;
    uint32_t payload_len = 0;
    uint64_t timestamp = 0;

    [[nodiscard]] static std::expected<Header, errc> from_fields(uint8_t version,
                                                               std::span<const std::byte> session_id,
                                                               uint8_t intent,
                                                               uint8_t priority,
                                                               uint8_t flags,
                                                               uint32_t sequence,
                                                               uint32_t payload_len,
                                                               uint64_t timestamp);

    [[nodiscard]] static std::expected<Header, errc> from_bytes(std::span<const std::byte> data);

    [[nodiscard]] bytes_t to_bytes() const;

    // Packet total on the wire: header + payload + trailer
    [[nodiscard]] size_t wire_size() const { return header_size + payload_len + hash_size; }

    bool operator==(const Header&) const = default;
};

} // namespace fdp
