#include <catch2/catch_test_macros.hpp>

#include "threadpool/threadpool.hpp"
#include "logger/metrics.hpp"
#include "packet/codec.hpp"
#include "fundamentals/bytes.hpp"

#include <format>
#include <future>
#include <vector>

using namespace fdp;

TEST_CASE("ThreadPool runs submitted work and returns results")
{
    ThreadPool pool(2);

    auto fut = pool.submit([] { return 21 * 2; });

    REQUIRE(fut.has_value());
    CHECK(fut->get() == 42);
    CHECK(pool.size() == 2);
}

TEST_CASE("ThreadPool with zero threads uses hardware concurrency")
{
    ThreadPool pool(0);

    CHECK(pool.size() >= 1);
}

TEST_CASE("ThreadPool refuses work after stop")
{
    ThreadPool pool(1);
    pool.stop();

    auto fut = pool.submit([] { return 1; });

    CHECK(!fut.has_value());
}

TEST_CASE("Codec decodes independent packets in parallel")
{
    constexpr size_t n_packets = 64;

    Codec codec;
    CodecMetrics metrics;

    std::vector<std::vector<std::byte>> wires;
    for (size_t i = 0; i < n_packets; ++i)
    {
        Packet pkt;
        pkt.sequence = static_cast<uint32_t>(i);
        pkt.payload = bytes::to_bytes(std::format("payload #{}", i));
        pkt.payload_len = static_cast<uint32_t>(pkt.payload.size());

        auto wire = codec.serialize(pkt);
        REQUIRE(wire.has_value());
        metrics.record_encode(wire->size());

        // Every fourth image is corrupted in its payload
        if (i % 4 == 3)
        {
            (*wire)[payload_pos] ^= std::byte{0xFF};
        }
        wires.push_back(std::move(*wire));
    }

    ThreadPool pool(4);
    std::vector<std::future<std::expected<Packet, errc>>> results;
    for (const auto& wire : wires)
    {
        auto fut = pool.submit([&codec, &metrics, &wire]
        {
            auto res = codec.deserialize(wire);
            if (res)
            {
                metrics.record_decode(wire.size());
            }
            else
            {
                metrics.record_reject(res.error());
            }
            return res;
        });
        REQUIRE(fut.has_value());
        results.push_back(std::move(*fut));
    }

    for (size_t i = 0; i < n_packets; ++i)
    {
        auto res = results[i].get();
        if (i % 4 == 3)
        {
            REQUIRE(!res.has_value());
            CHECK(res.error() == errc::hash_mismatch);
        }
        else
        {
            REQUIRE(res.has_value());
            CHECK(res->sequence == i);
            CHECK(bytes::to_string(res->payload) == std::format("payload #{}", i));
        }
    }

    CHECK(metrics.packets_encoded.load() == n_packets);
    CHECK(metrics.packets_decoded.load() == n_packets * 3 / 4);
    CHECK(metrics.rejected_count(errc::hash_mismatch) == n_packets / 4);
    CHECK(metrics.rejected_total() == n_packets / 4);
}

TEST_CASE("CodecMetrics report lists rejection kinds")
{
    CodecMetrics metrics;
    metrics.record_decode(100);
    metrics.record_reject(errc::too_short);
    metrics.record_reject(errc::too_short);

    auto report = std::format("{}", metrics);

    CHECK(report.find("CODEC METRICS REPORT") != std::string::npos);
    CHECK(report.find("too_short") != std::string::npos);
    CHECK(report.find("hash_mismatch") == std::string::npos);

    metrics.reset();

    CHECK(metrics.packets_decoded.load() == 0);
    CHECK(metrics.rejected_total() == 0);
}
