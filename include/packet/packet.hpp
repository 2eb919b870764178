#pragma once
#include "packet/flags.hpp"
#include "packet/header.hpp"
#include "packet/intent.hpp"
#include "packet/protocol.hpp"
#include "packet/session_id.hpp"
#include "crypto/integrity.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace fdp
{

struct Packet
{
    using payload_t = std::vector<std::byte>;

    uint8_t version = protocol_version;
    SessionId session_id;
    uint8_t intent = 0;
    uint8_t priority = 0;
    Flags flags;
    uint32_t sequence = 0;
    uint32_t payload_len = 0;
    uint64_t timestamp = 0;
    payload_t payload;
    crypto::Integrity::digest_t hash{}; // Filled in by Codec::deserialize

    // Current version, normal priority, no flags, sequence 0, timestamp = now (ns)
    static Packet make(const SessionId& sid, Intent intent, std::span<const std::byte> payload);

    Header header() const;

    // Compares content only; hash is derived from it
    bool operator==(const Packet& other) const;
};

} // namespace fdp
