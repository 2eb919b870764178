#include "config.hpp"
#include "logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <format>
#include <limits>

namespace {

template<std::unsigned_integral Ty>
std::expected<Ty, std::string> get_uint(const json::object& obj, std::string_view key,
                                        Ty min_val, Ty max_val, Ty default_val)
{
    auto it = obj.find(key);
    if (it == obj.end())
    {
        return default_val;
    }
    if (!it->value().is_int64() && !it->value().is_uint64())
    {
        return std::unexpected(std::format("'{}' must be an integer", key));
    }
    if (it->value().is_int64() && it->value().as_int64() < 0)
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    auto val = it->value().to_number<uint64_t>();
    if (val < static_cast<uint64_t>(min_val) || val > static_cast<uint64_t>(max_val))
    {
        return std::unexpected(std::format("'{}' must be between {} and {}",
                                           key, min_val, max_val));
    }
    return static_cast<Ty>(val);
}

template<std::unsigned_integral Ty>
std::expected<std::optional<Ty>, std::string> get_opt_uint(const json::object& obj, std::string_view key,
                                                           Ty min_val, Ty max_val)
{
    if (!obj.contains(key))
    {
        return std::optional<Ty>{};
    }
    return get_uint<Ty>(obj, key, min_val, max_val, min_val)
        .transform([](Ty v) { return std::optional<Ty>(v); });
}

std::string get_string(const json::object& obj, std::string_view key, std::string_view default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_string())
    {
        return std::string(default_val);
    }
    return std::string(it->value().as_string());
}

bool get_bool(const json::object& obj, std::string_view key, bool default_val)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->value().is_bool())
    {
        return default_val;
    }
    return it->value().as_bool();
}

} // namespace

std::expected<Config, std::string> Config::load(const std::string& filepath)
{
    std::ifstream file(filepath);
    if (!file.is_open())
    {
        return std::unexpected(std::format("Failed to open config file: {}", filepath));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    json::value jv;
    try
    {
        jv = json::parse(buffer.str());
    }
    catch (const std::exception& e)
    {
        return std::unexpected(std::format("JSON parse error: {}", e.what()));
    }
    return parse(jv);
}

Config Config::load_defaults()
{
    return Config{};
}

std::expected<Config, std::string> Config::load_or_defaults(const std::string& filepath)
{
    std::error_code ec;
    if (!std::filesystem::exists(filepath, ec) && !ec)
    {
        return load_defaults();
    }
    return load(filepath).transform_error([&](const std::string& e)
    {
        return std::format("{}: {}", filepath, e);
    });
}

fdp::Codec::Options Config::codec_options() const
{
    fdp::Codec::Options opts;
    opts.max_payload = cdc.max_payload_size;
    opts.strict_reserved_flags = cdc.strict_reserved_flags;
    if (cdc.intent_min && cdc.intent_max)
    {
        opts.intent_range = std::pair{*cdc.intent_min, *cdc.intent_max};
    }
    return opts;
}

std::expected<Config, std::string> Config::parse(const json::value& jv)
{
    if (!jv.is_object())
    {
        return std::unexpected("Config root must be a JSON object");
    }
    const auto& root = jv.as_object();
    Config config;
    if (auto it = root.find("codec"); it != root.end() && it->value().is_object())
    {
        const auto& cdc = it->value().as_object();
        if (auto max_payload = get_uint<size_t>(cdc, "max_payload_size", 0,
                                                std::numeric_limits<uint32_t>::max(),
                                                fdp::default_max_payload); max_payload)
        {
            config.cdc.max_payload_size = *max_payload;
        }
        else
        {
            return std::unexpected(max_payload.error());
        }
        config.cdc.strict_reserved_flags = get_bool(cdc, "strict_reserved_flags", false);

        auto intent_min = get_opt_uint<uint8_t>(cdc, "intent_min", 0, 255);
        if (!intent_min)
        {
            return std::unexpected(intent_min.error());
        }
        auto intent_max = get_opt_uint<uint8_t>(cdc, "intent_max", 0, 255);
        if (!intent_max)
        {
            return std::unexpected(intent_max.error());
        }
        if (intent_min->has_value() != intent_max->has_value())
        {
            return std::unexpected("'intent_min' and 'intent_max' must be given together");
        }
        if (intent_min->has_value() && **intent_min > **intent_max)
        {
            return std::unexpected("'intent_min' must not exceed 'intent_max'");
        }
        config.cdc.intent_min = *intent_min;
        config.cdc.intent_max = *intent_max;
    }
    if (auto it = root.find("workers"); it != root.end() && it->value().is_object())
    {
        const auto& wrk = it->value().as_object();
        if (auto threads = get_uint<size_t>(wrk, "threads", 0, 1024, 0); threads)
        {
            config.wrk.threads = *threads;
        }
        else
        {
            return std::unexpected(threads.error());
        }
    }
    if (auto it = root.find("logging"); it != root.end() && it->value().is_object())
    {
        const auto& log = it->value().as_object();
        config.log.level = get_string(log, "level", "info");
        if (!Logger::parse_level(config.log.level))
        {
            return std::unexpected(std::format("Unknown log level '{}'", config.log.level));
        }
        config.log.file = get_string(log, "file", "");
        if (auto max_size = get_uint<size_t>(log, "max_size_mb", 1, 10000, 100); max_size)
        {
            config.log.max_size_mb = *max_size;
        }
        else
        {
            return std::unexpected(max_size.error());
        }
        config.log.enable_console = get_bool(log, "enable_console", true);
    }
    return config;
}
