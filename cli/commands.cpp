#include "cli/commands.hpp"
#include "logger.hpp"
#include "logger/metrics.hpp"
#include "threadpool/threadpool.hpp"

#include <algorithm>
#include <charconv>
#include <concepts>
#include <filesystem>
#include <fstream>
#include <future>
#include <format>
#include <optional>
#include <print>
#include <vector>

namespace cli
{

namespace
{

constexpr size_t preview_len = 32;

template<std::unsigned_integral Ty>
std::optional<Ty> parse_num(std::string_view sv)
{
    Ty val = 0;
    if (auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
        ec == std::errc{} && ptr == sv.data() + sv.size())
    {
        return val;
    }
    return std::nullopt;
}

} // namespace

void print_usage(std::string_view prog)
{
    std::println("Usage: {} <command> [args]", prog);
    std::println("Commands:");
    std::println("  encode <payload-file> <out-file> [options]   Build a packet from a payload");
    std::println("      --session <hex32>   Session id (random if omitted)");
    std::println("      --intent <n>        Intent code (default {})", fdp::to_u8(fdp::Intent::DataPush));
    std::println("      --priority <n>      Priority (default {})", fdp::priority::normal);
    std::println("      --seq <n>           Sequence number (default 0)");
    std::println("      --timestamp <n>     Timestamp (default now, ns)");
    std::println("      --compressed | --encrypted | --fragmented");
    std::println("  decode <packet-file>                         Validate and print one packet");
    std::println("  verify <packet-file>...                      Validate packets in parallel");
}

std::expected<bytes::buffer_t, std::string> read_file(const std::string& path, size_t max_size)
{
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        return std::unexpected(std::format("cannot open {}: {}", path, ec.message()));
    }
    if (size > max_size)
    {
        return std::unexpected(std::format("{} is {} bytes, limit is {}", path, size, max_size));
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open())
    {
        return std::unexpected(std::format("cannot open {}", path));
    }

    bytes::buffer_t buf(static_cast<size_t>(size));
    f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
    if (static_cast<size_t>(f.gcount()) != buf.size())
    {
        return std::unexpected(std::format("read error on {}", path));
    }
    return buf;
}

std::expected<void, std::string> write_file(const std::string& path, std::span<const std::byte> data)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open())
    {
        return std::unexpected(std::format("cannot open {}", path));
    }
    f.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!f)
    {
        return std::unexpected(std::format("write error on {}", path));
    }
    return {};
}

size_t packet_file_limit(const fdp::Codec& codec)
{
    return fdp::min_packet_size + codec.options().max_payload;
}

int cmd_encode(const fdp::Codec& codec, std::span<const std::string> args)
{
    if (args.size() < 2)
    {
        std::println(stderr, "encode needs <payload-file> <out-file>");
        return 1;
    }

    auto payload = read_file(args[0], codec.options().max_payload);
    if (!payload)
    {
        std::println(stderr, "Failed to read payload: {}", payload.error());
        return 1;
    }

    auto sid = fdp::SessionId::generate();
    if (!sid)
    {
        std::println(stderr, "Failed to generate session id: {}", sid.error());
        return 1;
    }

    auto pkt = fdp::Packet::make(*sid, fdp::Intent::DataPush, *payload);

    for (size_t i = 2; i < args.size(); ++i)
    {
        std::string_view opt = args[i];
        bool has_val = i + 1 < args.size();

        if (opt == "--compressed")
        {
            pkt.flags = pkt.flags.with(fdp::Flag::Compressed, true);
        }
        else if (opt == "--encrypted")
        {
            pkt.flags = pkt.flags.with(fdp::Flag::Encrypted, true);
        }
        else if (opt == "--fragmented")
        {
            pkt.flags = pkt.flags.with(fdp::Flag::Fragmented, true);
        }
        else if (opt == "--session" && has_val)
        {
            auto parsed = fdp::SessionId::from_hex(args[++i]);
            if (!parsed)
            {
                std::println(stderr, "--session expects {} hex digits", fdp::SessionId::size * 2);
                return 1;
            }
            pkt.session_id = *parsed;
        }
        else if ((opt == "--intent" || opt == "--priority") && has_val)
        {
            auto v = parse_num<uint8_t>(args[++i]);
            if (!v)
            {
                std::println(stderr, "{} expects a value in 0..255", opt);
                return 1;
            }
            (opt == "--intent" ? pkt.intent : pkt.priority) = *v;
        }
        else if (opt == "--seq" && has_val)
        {
            auto v = parse_num<uint32_t>(args[++i]);
            if (!v)
            {
                std::println(stderr, "--seq expects a 32-bit unsigned value");
                return 1;
            }
            pkt.sequence = *v;
        }
        else if (opt == "--timestamp" && has_val)
        {
            auto v = parse_num<uint64_t>(args[++i]);
            if (!v)
            {
                std::println(stderr, "--timestamp expects a 64-bit unsigned value");
                return 1;
            }
            pkt.timestamp = *v;
        }
        else
        {
            std::println(stderr, "Unknown or incomplete option: {}", opt);
            return 1;
        }
    }

    auto wire = codec.serialize(pkt);
    if (!wire)
    {
        std::println(stderr, "Failed to serialize packet: {}", wire.error());
        return 1;
    }

    if (auto res = write_file(args[1], *wire); !res)
    {
        std::println(stderr, "Failed to write packet: {}", res.error());
        return 1;
    }

    LOG_INFO("Encoded {} payload bytes into {} ({} bytes, session {})",
             pkt.payload_len, args[1], wire->size(), pkt.session_id);
    return 0;
}

int cmd_decode(const fdp::Codec& codec, const std::string& path)
{
    auto data = read_file(path, packet_file_limit(codec));
    if (!data)
    {
        std::println(stderr, "Failed to read packet: {}", data.error());
        return 1;
    }

    auto pkt = codec.deserialize(*data);
    if (!pkt)
    {
        std::println(stderr, "{}: rejected ({})", path, pkt.error());
        return 1;
    }

    auto intent = fdp::intent_from_u8(pkt->intent);
    auto preview = std::span(pkt->payload).first(std::min(preview_len, pkt->payload.size()));

    std::println("{:<14} {}", "Version", pkt->version);
    std::println("{:<14} {}", "Session", pkt->session_id);
    std::println("{:<14} 0x{:02x} ({})", "Intent", pkt->intent,
                 intent ? fdp::to_string(*intent) : std::string_view("unknown"));
    std::println("{:<14} {}", "Priority", pkt->priority);
    std::println("{:<14} 0x{:02x} compressed={} encrypted={} fragmented={} reserved=0x{:02x}", "Flags",
                 pkt->flags.raw(), pkt->flags.compressed(), pkt->flags.encrypted(),
                 pkt->flags.fragmented(), pkt->flags.reserved());
    std::println("{:<14} {}", "Sequence", pkt->sequence);
    std::println("{:<14} {}", "Timestamp", pkt->timestamp);
    std::println("{:<14} {}", "Payload bytes", pkt->payload_len);
    std::println("{:<14} {}{}", "Payload", bytes::to_hex(preview),
                 preview.size() < pkt->payload.size() ? "..." : "");
    std::println("{:<14} {}", "SHA-256", bytes::to_hex(std::as_bytes(std::span(pkt->hash))));
    return 0;
}

int cmd_verify(const fdp::Codec& codec, const Config& config, std::span<const std::string> paths)
{
    if (paths.empty())
    {
        std::println(stderr, "verify needs at least one <packet-file>");
        return 1;
    }

    CodecMetrics metrics;
    ThreadPool pool(config.workers().threads);

    std::vector<std::future<std::expected<size_t, std::string>>> results;
    results.reserve(paths.size());

    const size_t limit = packet_file_limit(codec);

    for (const auto& path : paths)
    {
        auto fut = pool.submit([&codec, &metrics, &path, limit]() -> std::expected<size_t, std::string>
        {
            auto data = read_file(path, limit);
            if (!data)
            {
                return std::unexpected(data.error());
            }
            auto pkt = codec.deserialize(*data);
            if (!pkt)
            {
                metrics.record_reject(pkt.error());
                return std::unexpected(std::format("rejected ({})", pkt.error()));
            }
            metrics.record_decode(data->size());
            return data->size();
        });

        if (!fut)
        {
            std::println(stderr, "Failed to schedule {}: {}", path, fut.error());
            return 1;
        }
        results.push_back(std::move(*fut));
    }

    int status = 0;
    for (size_t i = 0; i < results.size(); ++i)
    {
        auto res = results[i].get();
        if (res)
        {
            std::println("{}: ok ({} bytes)", paths[i], *res);
        }
        else
        {
            std::println("{}: {}", paths[i], res.error());
            status = 1;
        }
    }

    pool.stop();
    std::println("{}", metrics);
    return status;
}

} // namespace cli
