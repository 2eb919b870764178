#pragma once

#include "packet/codec.hpp"
#include "packet/protocol.hpp"

#include <boost/json.hpp>
#include <string>
#include <expected>
#include <optional>
#include <cstdint>

namespace json = boost::json;

/**
 * Codec and tool configuration loaded from a JSON file.
 * Load-once at startup, immutable thereafter.
 */
class Config
{
public:
    struct CodecCfg
    {
        size_t max_payload_size = fdp::default_max_payload;
        bool strict_reserved_flags = false;
        std::optional<uint8_t> intent_min;
        std::optional<uint8_t> intent_max;
    };

    struct WorkersCfg
    {
        size_t threads = 0;
    };

    struct LoggingCfg
    {
        std::string level = "info";
        std::string file = "";
        size_t max_size_mb = 100;
        bool enable_console = true;
    };

    [[nodiscard]] static std::expected<Config, std::string> load(const std::string& filepath);
    [[nodiscard]] static Config load_defaults();
    // Defaults only when the file is absent; a file that exists must parse.
    [[nodiscard]] static std::expected<Config, std::string> load_or_defaults(const std::string& filepath);

    [[nodiscard]] const CodecCfg& codec() const { return cdc; }
    [[nodiscard]] const WorkersCfg& workers() const { return wrk; }
    [[nodiscard]] const LoggingCfg& logging() const { return log; }

    [[nodiscard]] fdp::Codec::Options codec_options() const;

private:
    CodecCfg cdc;
    WorkersCfg wrk;
    LoggingCfg log;

    [[nodiscard]] static std::expected<Config, std::string> parse(const json::value& jv);
};
