#include "crypto/integrity.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <memory>

namespace crypto
{

std::optional<Integrity::digest_t> Integrity::compute(std::span<const std::byte> data)
{
    digest_t md{};
    unsigned int md_len = 0;

    if (EVP_Digest(data.data(), data.size(), md.data(), std::addressof(md_len), EVP_sha256(), nullptr) != 1)
    {
        return std::nullopt;
    }

    if (md_len != digest_sz)
    {
        return std::nullopt;
    }

    return md;
}

bool Integrity::verify(std::span<const std::byte> data)
{
    if (data.size() < digest_sz)
    {
        return false;
    }

    auto body = data.first(data.size() - digest_sz);
    auto trailer = data.last(digest_sz);

    auto md = compute(body);
    if (!md)
    {
        return false;
    }

    return equal(*md, std::span(reinterpret_cast<const uint8_t*>(trailer.data()), trailer.size()));
}

bool Integrity::equal(std::span<const uint8_t> a, std::span<const uint8_t> b)
{
    if (a.size() != b.size())
    {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace crypto
