#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace crypto
{

// SHA-256 trailer over header+payload. Keyless: detects corruption, not forgery.
class Integrity
{
public:
    static constexpr size_t digest_sz = 32;

    using digest_t = std::array<uint8_t, digest_sz>;

    static std::optional<digest_t> compute(std::span<const std::byte> data);

    // Recomputes over data[0, size - digest_sz) and compares against the last digest_sz bytes
    static bool verify(std::span<const std::byte> data);

    // Constant-time comparison, false on size mismatch
    static bool equal(std::span<const uint8_t> a, std::span<const uint8_t> b);
};

} // namespace crypto
