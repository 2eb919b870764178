#pragma once
#include <cstdint>

namespace fdp
{

// Control byte layout:
// [7-3] Reserved, carried through untouched
// [2]   Fragmented: part of a larger message
// [1]   Encrypted: payload is ciphertext
// [0]   Compressed: payload is compressed
enum class Flag : uint8_t
{
    Compressed = 0,
    Encrypted  = 1,
    Fragmented = 2,
};

class Flags
{
public:
    static constexpr uint8_t defined_mask  = 0x07;
    static constexpr uint8_t reserved_mask = static_cast<uint8_t>(~defined_mask);

    constexpr Flags() = default;
    constexpr explicit Flags(uint8_t raw) : bits(raw) {}

    static constexpr uint8_t mask(Flag f) { return static_cast<uint8_t>(1u << static_cast<uint8_t>(f)); }

    constexpr bool get(Flag f) const { return (bits & mask(f)) != 0; }

    [[nodiscard]] constexpr Flags with(Flag f, bool on) const
    {
        return Flags(on ? static_cast<uint8_t>(bits | mask(f))
                        : static_cast<uint8_t>(bits & ~mask(f)));
    }

    constexpr uint8_t raw() const { return bits; }
    constexpr uint8_t reserved() const { return bits & reserved_mask; }

    constexpr bool compressed() const { return get(Flag::Compressed); }
    constexpr bool encrypted() const { return get(Flag::Encrypted); }
    constexpr bool fragmented() const { return get(Flag::Fragmented); }

    constexpr bool operator==(const Flags&) const = default;

private:
    uint8_t bits = 0;
};

} // namespace fdp
