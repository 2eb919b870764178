#include "packet/header.hpp"
#include "fundamentals/bytes.hpp"
#include <algorithm>

namespace fdp
{

using namespace bytes;

std::expected<Header, errc> Header::from_fields(uint8_t version,
                                                std::span<const std::byte> session_id,
                                                uint8_t intent,
                                                uint8_t priority,
                                                uint8_t flags,
                                                uint32_t sequence,
                                                uint32_t payload_len,
                                                uint64_t timestamp)
{
    auto sid = SessionId::from_bytes(session_id);
    if (!sid)
    {
        return std::unexpected(sid.error());
    }

    return Header{.version = version,
                  .session_id = *sid,
                  .intent = intent,
                  .priority = priority,
                  .flags = Flags(flags),
                  .sequence = sequence,
                  .payload_len = payload_len,
                  .timestamp = timestamp};
}

std::expected<Header, errc> Header::from_bytes(std::span<const std::byte> data)
{
    if (data.size() != header_size)
    {
        return std::unexpected(errc::malformed);
    }

    return from_fields(std::to_integer<uint8_t>(data[version_pos]),
                       data.subspan(session_id_pos, SessionId::size),
                       std::to_integer<uint8_t>(data[intent_pos]),
                       std::to_integer<uint8_t>(data[priority_pos]),
                       std::to_integer<uint8_t>(data[flags_pos]),
                       to_int<uint32_t>(data.subspan(sequence_pos)),
                       to_int<uint32_t>(data.subspan(payload_len_pos)),
                       to_int<uint64_t>(data.subspan(timestamp_pos)))
        .transform_error([](errc) { return errc::malformed; });
}

Header::bytes_t Header::to_bytes() const
{
    bytes_t ret{};
    std::span<std::byte> out(ret);

    out[version_pos] = int2byte(version);
    std::ranges::copy(session_id.bytes(), out.begin() + session_id_pos);
    out[intent_pos] = int2byte(intent);
    out[priority_pos] = int2byte(priority);
    out[flags_pos] = int2byte(flags.raw());
    from_int(out.subspan(sequence_pos), sequence);
    from_int(out.subspan(payload_len_pos), payload_len);
    from_int(out.subspan(timestamp_pos), timestamp);

    return ret;
}

} // namespace fdp
