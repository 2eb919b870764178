#pragma once
#include <cstddef>
#include <cstdint>
#include <format>
#include <string_view>

namespace fdp
{

enum class errc : uint8_t
{
    too_short = 1,
    malformed,
    payload_length_mismatch,
    length_mismatch,
    version_mismatch,
    hash_mismatch,
    invalid_session_id_length,
    payload_too_large,
    reserved_flags_set,
    intent_out_of_range,
    digest_err,
};

// One past the highest errc value, for per-kind counter tables
constexpr size_t errc_count = static_cast<size_t>(errc::digest_err) + 1;

constexpr std::string_view to_string(errc e)
{
    switch (e)
    {
        case errc::too_short:                 return "too_short";
        case errc::malformed:                 return "malformed";
        case errc::payload_length_mismatch:   return "payload_length_mismatch";
        case errc::length_mismatch:           return "length_mismatch";
        case errc::version_mismatch:          return "version_mismatch";
        case errc::hash_mismatch:             return "hash_mismatch";
        case errc::invalid_session_id_length: return "invalid_session_id_length";
        case errc::payload_too_large:         return "payload_too_large";
        case errc::reserved_flags_set:        return "reserved_flags_set";
        case errc::intent_out_of_range:       return "intent_out_of_range";
        case errc::digest_err:                return "digest_err";
    }
    return "unknown";
}

} // namespace fdp

template<>
struct std::formatter<fdp::errc> : std::formatter<std::string_view>
{
    auto format(fdp::errc e, std::format_context& fc) const
    {
        return std::formatter<std::string_view>::format(fdp::to_string(e), fc);
    }
};
