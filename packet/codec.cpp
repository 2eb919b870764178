#include "packet/codec.hpp"
#include "crypto/integrity.hpp"
#include "logger.hpp"
#include <algorithm>
#include <ranges>
#include <iterator>

namespace fdp
{

namespace
{

std::unexpected<errc> reject(errc e, size_t size)
{
    LOG_DEBUG("Packet rejected: {} ({} bytes)", e, size);
    return std::unexpected(e);
}

} // namespace

std::expected<Codec::bytes_t, errc> Codec::serialize(const Packet& pkt) const
{
    if (pkt.payload.size() != pkt.payload_len)
    {
        LOG_WARN("Refusing to serialize packet seq {}: payload is {} bytes, header claims {}",
                 pkt.sequence, pkt.payload.size(), pkt.payload_len);
        return std::unexpected(errc::payload_length_mismatch);
    }

    if (pkt.payload_len > opts.max_payload)
    {
        LOG_WARN("Refusing to serialize packet seq {}: payload {} exceeds limit {}",
                 pkt.sequence, pkt.payload_len, opts.max_payload);
        return std::unexpected(errc::payload_too_large);
    }

    bytes_t ret;
    ret.reserve(pkt.header().wire_size());

    auto ist = std::back_inserter(ret);
    std::ranges::copy(pkt.header().to_bytes(), ist);
    std::ranges::copy(pkt.payload, ist);

    auto md = crypto::Integrity::compute(ret);
    if (!md)
    {
        LOG_ERROR("SHA-256 computation failed for packet seq {}", pkt.sequence);
        return std::unexpected(errc::digest_err);
    }

    std::ranges::copy(*md | std::views::transform([](uint8_t b) { return static_cast<std::byte>(b); }), ist);
    return ret;
}

std::expected<Packet, errc> Codec::deserialize(std::span<const std::byte> data) const
{
    if (data.size() < min_packet_size)
    {
        return reject(errc::too_short, data.size());
    }

    if (data.size() - min_packet_size > opts.max_payload)
    {
        return reject(errc::payload_too_large, data.size());
    }

    auto hdr = Header::from_bytes(data.first(header_size));
    if (!hdr)
    {
        return reject(errc::malformed, data.size());
    }

    // Declared length and version are checked before any hashing
    if (hdr->wire_size() != data.size())
    {
        return reject(errc::length_mismatch, data.size());
    }

    if (hdr->version != protocol_version)
    {
        return reject(errc::version_mismatch, data.size());
    }

    if (!crypto::Integrity::verify(data))
    {
        return reject(errc::hash_mismatch, data.size());
    }

    if (auto policy = check_policy(*hdr); !policy)
    {
        return reject(policy.error(), data.size());
    }

    Packet pkt{.version = hdr->version,
               .session_id = hdr->session_id,
               .intent = hdr->intent,
               .priority = hdr->priority,
               .flags = hdr->flags,
               .sequence = hdr->sequence,
               .payload_len = hdr->payload_len,
               .timestamp = hdr->timestamp,
               .payload = std::ranges::to<Packet::payload_t>(data.subspan(payload_pos, hdr->payload_len)),
               .hash = {}};

    std::ranges::copy(data.last(hash_size) | std::views::transform([](std::byte b) { return std::to_integer<uint8_t>(b); }),
                      pkt.hash.begin());
    return pkt;
}

std::expected<void, errc> Codec::check_policy(const Header& hdr) const
{
    if (opts.strict_reserved_flags && hdr.flags.reserved() != 0)
    {
        return std::unexpected(errc::reserved_flags_set);
    }

    if (opts.intent_range)
    {
        auto [lo, hi] = *opts.intent_range;
        if (hdr.intent < lo || hdr.intent > hi)
        {
            return std::unexpected(errc::intent_out_of_range);
        }
    }

    return {};
}

} // namespace fdp
