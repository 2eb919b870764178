#include "packet/packet.hpp"
#include <ranges>
#include <chrono>

namespace fdp
{

Packet Packet::make(const SessionId& sid, Intent intent, std::span<const std::byte> payload)
{
    auto now = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch());

    return Packet{.version = protocol_version,
                  .session_id = sid,
                  .intent = to_u8(intent),
                  .priority = priority::normal,
                  .flags = Flags{},
                  .sequence = 0,
                  .payload_len = static_cast<uint32_t>(payload.size()),
                  .timestamp = static_cast<uint64_t>(now.count()),
                  .payload = std::ranges::to<payload_t>(payload),
                  .hash = {}};
}

Header Packet::header() const
{
    return Header{.version = version,
                  .session_id = session_id,
                  .intent = intent,
                  .priority = priority,
                  .flags = flags,
                  .sequence = sequence,
                  .payload_len = payload_len,
                  .timestamp = timestamp};
}

bool Packet::operator==(const Packet& other) const
{
    return header() == other.header() && payload == other.payload;
}

} // namespace fdp
