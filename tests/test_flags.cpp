#include <catch2/catch_test_macros.hpp>

#include "packet/flags.hpp"

#include <array>
#include <cstdint>

using fdp::Flag;
using fdp::Flags;

namespace
{

constexpr std::array all_flags{Flag::Compressed, Flag::Encrypted, Flag::Fragmented};

} // namespace

TEST_CASE("Flags default to all bits clear")
{
    Flags f;

    CHECK(f.raw() == 0);
    CHECK(!f.compressed());
    CHECK(!f.encrypted());
    CHECK(!f.fragmented());
}

TEST_CASE("Flags use bits 0, 1 and 2")
{
    CHECK(Flags{}.with(Flag::Compressed, true).raw() == 0x01);
    CHECK(Flags{}.with(Flag::Encrypted, true).raw() == 0x02);
    CHECK(Flags{}.with(Flag::Fragmented, true).raw() == 0x04);
}

TEST_CASE("Flags::with changes exactly one bit for every byte value")
{
    for (unsigned raw = 0; raw <= 0xFF; ++raw)
    {
        Flags before(static_cast<uint8_t>(raw));

        for (auto flag : all_flags)
        {
            for (bool v : {false, true})
            {
                Flags after = before.with(flag, v);

                CHECK(after.get(flag) == v);
                CHECK((after.raw() & ~Flags::mask(flag)) == (before.raw() & ~Flags::mask(flag)));
            }
        }
    }
}

TEST_CASE("Flags keep reserved bits untouched")
{
    Flags f(0xA8);

    CHECK(f.reserved() == 0xA8);

    f = f.with(Flag::Encrypted, true).with(Flag::Compressed, true);

    CHECK(f.raw() == 0xAB);
    CHECK(f.reserved() == 0xA8);

    f = f.with(Flag::Encrypted, false);

    CHECK(f.raw() == 0xA9);
}

TEST_CASE("Flags are usable in constant expressions")
{
    constexpr Flags f = Flags{}.with(Flag::Fragmented, true);

    static_assert(f.fragmented());
    static_assert(f.raw() == 0x04);
    static_assert(Flags::reserved_mask == 0xF8);
    CHECK(f == Flags(0x04));
}
