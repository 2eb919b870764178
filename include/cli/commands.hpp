#pragma once

#include "config.hpp"
#include "packet/codec.hpp"
#include "fundamentals/bytes.hpp"

#include <expected>
#include <span>
#include <string>
#include <string_view>

/**
 * fdp_tool command bodies. Each returns the process exit status.
 */
namespace cli
{

// Reads a whole file whose size, taken from the filesystem, is at most
// max_size. Larger files fail before any buffer is allocated.
[[nodiscard]] std::expected<bytes::buffer_t, std::string> read_file(const std::string& path, size_t max_size);

[[nodiscard]] std::expected<void, std::string> write_file(const std::string& path, std::span<const std::byte> data);

// Largest packet file the codec could accept
[[nodiscard]] size_t packet_file_limit(const fdp::Codec& codec);

void print_usage(std::string_view prog);

int cmd_encode(const fdp::Codec& codec, std::span<const std::string> args);
int cmd_decode(const fdp::Codec& codec, const std::string& path);
int cmd_verify(const fdp::Codec& codec, const Config& config, std::span<const std::string> paths);

} // namespace cli
