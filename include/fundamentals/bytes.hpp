#pragma once
#include <concepts>
#include <bit>
#include <span>
#include <vector>
#include <string>
#include <optional>
#include <cstring>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <ranges>

namespace bytes
{

using buffer_t = std::vector<std::byte>;

inline std::byte int2byte(uint8_t i)
{
    return static_cast<std::byte>(i);
}

// Wire order is big-endian
constexpr auto endify(std::integral auto i)
{
    if constexpr(std::endian::native == std::endian::little)
    {
        return std::byteswap(i);
    }
    else
    {
        return i;
    }
}

template<std::integral Ty = uint32_t>
Ty to_int(std::span<const std::byte> from)
{
    Ty ret = 0;
    std::memcpy(std::addressof(ret), from.data(), sizeof(Ty));
    return endify(ret);
}

template<class To, std::integral From>
void from_int(std::span<To> to, From val)
{
    val = endify(val);
    std::memcpy(to.data(), std::addressof(val), sizeof(From));
}

inline buffer_t to_bytes(std::string_view sv)
{
    return sv |
        std::views::transform([](char ch){ return int2byte(static_cast<uint8_t>(ch)); }) |
        std::ranges::to<buffer_t>();
}

inline std::string to_string(std::span<const std::byte> data)
{
    return data |
        std::views::transform([](std::byte b){ return static_cast<char>(b); }) |
        std::ranges::to<std::string>();
}

inline std::string to_hex(std::span<const std::byte> data)
{
    static constexpr char digits[] = "0123456789abcdef";

    std::string ret;
    ret.reserve(data.size() * 2);
    for (auto b : data)
    {
        auto v = std::to_integer<uint8_t>(b);
        ret.push_back(digits[v >> 4]);
        ret.push_back(digits[v & 0x0F]);
    }
    return ret;
}

inline std::optional<buffer_t> from_hex(std::string_view hex)
{
    auto nibble = [](char ch) -> int
    {
        if (ch >= '0' && ch <= '9') return ch - '0';
        if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
        if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
        return -1;
    };

    if (hex.size() % 2 != 0)
    {
        return std::nullopt;
    }

    buffer_t ret;
    ret.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2)
    {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0)
        {
            return std::nullopt;
        }
        ret.push_back(int2byte(static_cast<uint8_t>((hi << 4) | lo)));
    }
    return ret;
}

} // namespace bytes
