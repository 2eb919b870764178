#pragma once
#include <cstddef>
#include <cstdint>

namespace fdp
{

constexpr uint8_t protocol_version = 1;

// Header field offsets
constexpr size_t version_pos     = 0;
constexpr size_t session_id_pos  = 1;
constexpr size_t intent_pos      = 17;
constexpr size_t priority_pos    = 18;
constexpr size_t flags_pos       = 19;
constexpr size_t sequence_pos    = 20;
constexpr size_t payload_len_pos = 24;
constexpr size_t timestamp_pos   = 28;
constexpr size_t payload_pos     = 36;

constexpr size_t header_size     = 36;
constexpr size_t hash_size       = 32;
constexpr size_t min_packet_size = header_size + hash_size;

constexpr size_t default_max_payload = 10 * 1024 * 1024;

} // namespace fdp
