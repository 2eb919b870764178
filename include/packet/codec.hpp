#pragma once
#include "packet/errc.hpp"
#include "packet/packet.hpp"
#include "packet/protocol.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace fdp
{

/**
 * Serializes packets to the FDP wire image and validates wire images back into packets.
 *
 * Immutable after construction, so one instance may be shared across threads.
 * Validation order on receipt: size, header parse, declared length, version,
 * SHA-256 trailer, then the optional policy checks. The first failing stage
 * decides the error; nothing is materialised on failure.
 */
class Codec
{
public:
    using bytes_t = std::vector<std::byte>;

    struct Options
    {
        size_t max_payload = default_max_payload;
        bool strict_reserved_flags = false;
        std::optional<std::pair<uint8_t, uint8_t>> intent_range; // inclusive
    };

    Codec() = default;
    explicit Codec(Options o) : opts(std::move(o)) {}

    [[nodiscard]] std::expected<bytes_t, errc> serialize(const Packet& pkt) const;
    [[nodiscard]] std::expected<Packet, errc> deserialize(std::span<const std::byte> data) const;

    [[nodiscard]] const Options& options() const { return opts; }

private:
    Options opts;

    std::expected<void, errc> check_policy(const Header& hdr) const;
};

} // namespace fdp
