#include <catch2/catch_test_macros.hpp>

#include "crypto/integrity.hpp"
#include "fundamentals/bytes.hpp"

#include <array>
#include <vector>
#include <span>

using namespace crypto;

namespace
{

std::string hex(const Integrity::digest_t& md)
{
    return bytes::to_hex(std::as_bytes(std::span(md)));
}

std::vector<std::byte> with_trailer(std::vector<std::byte> body)
{
    auto md = Integrity::compute(body);
    for (auto b : *md)
    {
        body.push_back(static_cast<std::byte>(b));
    }
    return body;
}

} // namespace

TEST_CASE("Integrity::compute matches SHA-256 test vectors")
{
    auto empty = Integrity::compute({});
    auto abc = Integrity::compute(bytes::to_bytes("abc"));

    REQUIRE(empty.has_value());
    REQUIRE(abc.has_value());
    CHECK(hex(*empty) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(hex(*abc) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Integrity::verify accepts an intact buffer")
{
    auto full = with_trailer(bytes::to_bytes("header and payload"));

    CHECK(Integrity::verify(full));
}

TEST_CASE("Integrity::verify accepts a trailer over an empty body")
{
    auto full = with_trailer({});

    REQUIRE(full.size() == Integrity::digest_sz);
    CHECK(Integrity::verify(full));
}

TEST_CASE("Integrity::verify detects tampered body")
{
    auto full = with_trailer(bytes::to_bytes("header and payload"));

    full[3] ^= std::byte{0x01};

    CHECK(!Integrity::verify(full));
}

TEST_CASE("Integrity::verify detects tampered trailer")
{
    auto full = with_trailer(bytes::to_bytes("header and payload"));

    full.back() ^= std::byte{0x80};

    CHECK(!Integrity::verify(full));
}

TEST_CASE("Integrity::verify rejects buffers shorter than a digest")
{
    std::vector<std::byte> tiny(Integrity::digest_sz - 1);

    CHECK(!Integrity::verify(tiny));
}

TEST_CASE("Integrity::equal compares size and content")
{
    std::array<uint8_t, 4> a{1, 2, 3, 4};
    std::array<uint8_t, 4> b{1, 2, 3, 4};
    std::array<uint8_t, 4> c{1, 2, 3, 5};
    std::array<uint8_t, 3> d{1, 2, 3};

    CHECK(Integrity::equal(a, b));
    CHECK(!Integrity::equal(a, c));
    CHECK(!Integrity::equal(a, d));
}
