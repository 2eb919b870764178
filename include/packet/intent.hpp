#pragma once
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace fdp
{

// Receiver-action codes known to this build. The codec carries the raw byte
// and never requires it to be one of these.
enum class Intent : uint8_t
{
    // Connection
    Ping            = 0x01,
    Pong            = 0x02,
    HandshakeInit   = 0x03,
    HandshakeAck    = 0x04,
    Close           = 0x05,

    // Search
    Search          = 0x10,
    SearchSuggest   = 0x11,
    FetchDocument   = 0x12,
    SearchStream    = 0x13,

    // Data sync
    DataRequest     = 0x20,
    DataPush        = 0x21,
    DataDelta       = 0x22,
    DataVerify      = 0x23,

    // Ranking
    RankingUpdate   = 0x30,
    RankingRequest  = 0x31,

    // Edge cache
    CacheQuery      = 0x40,
    CacheInvalidate = 0x41,

    // Status
    Error           = 0xF0,
    Success         = 0xF1,
};

constexpr uint8_t to_u8(Intent i) { return std::to_underlying(i); }

std::optional<Intent> intent_from_u8(uint8_t code);
std::string_view to_string(Intent i);

// Higher value = more urgent. The codec does not interpret priority.
namespace priority
{
    constexpr uint8_t lowest   = 0;
    constexpr uint8_t low      = 64;
    constexpr uint8_t normal   = 128;
    constexpr uint8_t high     = 192;
    constexpr uint8_t critical = 255;
} // namespace priority

} // namespace fdp
