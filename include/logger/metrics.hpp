#pragma once
#include "packet/errc.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <ranges>
#include <format>
#include <string>
#include <vector>

struct CodecMetrics
{
    std::atomic<uint64_t> packets_encoded{0};
    std::atomic<uint64_t> packets_decoded{0};
    std::atomic<uint64_t> bytes_encoded{0};
    std::atomic<uint64_t> bytes_decoded{0};
    std::array<std::atomic<uint64_t>, fdp::errc_count> rejected{};

    std::chrono::steady_clock::time_point start_time{std::chrono::steady_clock::now()};

    CodecMetrics() = default;

    void record_encode(size_t wire_bytes)
    {
        packets_encoded.fetch_add(1, std::memory_order_relaxed);
        bytes_encoded.fetch_add(wire_bytes, std::memory_order_relaxed);
    }

    void record_decode(size_t wire_bytes)
    {
        packets_decoded.fetch_add(1, std::memory_order_relaxed);
        bytes_decoded.fetch_add(wire_bytes, std::memory_order_relaxed);
    }

    void record_reject(fdp::errc e)
    {
        rejected[static_cast<size_t>(e)].fetch_add(1, std::memory_order_relaxed);
    }

    uint64_t rejected_count(fdp::errc e) const
    {
        return rejected[static_cast<size_t>(e)].load();
    }

    uint64_t rejected_total() const
    {
        uint64_t total = 0;
        for (const auto& r : rejected)
        {
            total += r.load();
        }
        return total;
    }

    void reset()
    {
        start_time = std::chrono::steady_clock::now();
        packets_encoded = 0;
        packets_decoded = 0;
        bytes_encoded = 0;
        bytes_decoded = 0;
        for (auto& r : rejected)
        {
            r = 0;
        }
    }
};

template<>
struct std::formatter<CodecMetrics>
{
    constexpr auto parse(std::format_parse_context& fpc)
    {
        return fpc.begin();
    }

    auto format(const CodecMetrics& m, std::format_context& fc) const
    {
        auto now = std::chrono::steady_clock::now();
        auto uptime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - m.start_time).count();
        double uptime = std::max<double>(uptime_ms / 1000.0, 0.001);

        uint64_t enc = m.packets_encoded.load();
        uint64_t dec = m.packets_decoded.load();
        uint64_t rej = m.rejected_total();

        constexpr double KB = 1024.0;

        std::vector<std::string> lines;

        lines.push_back(std::format(""));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("CODEC METRICS REPORT"));
        lines.push_back(std::format("============================================================"));
        lines.push_back(std::format("Elapsed: {:.3f}s", uptime));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- PACKETS ---"));
        lines.push_back(std::format("  Encoded:         {}", enc));
        lines.push_back(std::format("  Decoded:         {}", dec));
        lines.push_back(std::format("  Rejected:        {}", rej));
        lines.push_back(std::format("  Accept Rate:     {:.1f}%", dec + rej > 0 ? (dec * 100.0 / (dec + rej)) : 0.0));
        lines.push_back(std::format("  Decode Rate:     {:.1f}/sec", dec / uptime));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- BYTES ---"));
        lines.push_back(std::format("  Encoded:         {:.2f} KB", m.bytes_encoded.load() / KB));
        lines.push_back(std::format("  Decoded:         {:.2f} KB", m.bytes_decoded.load() / KB));
        lines.push_back(std::format(""));
        lines.push_back(std::format("--- REJECTIONS ---"));
        for (size_t i = 1; i < fdp::errc_count; ++i)
        {
            auto e = static_cast<fdp::errc>(i);
            if (auto n = m.rejected_count(e); n > 0)
            {
                lines.push_back(std::format("  {:<26} {}", fdp::to_string(e), n));
            }
        }
        lines.push_back(std::format("============================================================"));

        return std::ranges::copy(lines | std::views::join_with('\n'), fc.out()).out;
    }
};
