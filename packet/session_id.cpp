#include "packet/session_id.hpp"
#include "fundamentals/bytes.hpp"
#include <openssl/rand.h>
#include <algorithm>

namespace fdp
{

std::expected<SessionId, errc> SessionId::from_bytes(std::span<const std::byte> data)
{
    if (data.size() != size)
    {
        return std::unexpected(errc::invalid_session_id_length);
    }

    bytes_t raw{};
    std::ranges::copy(data, raw.begin());
    return SessionId(raw);
}

std::optional<SessionId> SessionId::from_hex(std::string_view hex)
{
    auto raw = bytes::from_hex(hex);
    if (!raw)
    {
        return std::nullopt;
    }

    auto sid = from_bytes(*raw);
    if (!sid)
    {
        return std::nullopt;
    }
    return *sid;
}

std::expected<SessionId, std::string> SessionId::generate()
{
    bytes_t raw{};
    if (RAND_bytes(reinterpret_cast<unsigned char*>(raw.data()), static_cast<int>(raw.size())) != 1)
    {
        return std::unexpected("RAND_bytes failed");
    }
    return SessionId(raw);
}

std::string SessionId::to_hex() const
{
    return bytes::to_hex(id);
}

} // namespace fdp
