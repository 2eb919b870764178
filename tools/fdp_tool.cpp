#include "cli/commands.hpp"
#include "config.hpp"
#include "logger.hpp"

#include <print>
#include <string>
#include <string_view>
#include <vector>

namespace
{

constexpr const char* config_file = "fdp_config.json";

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        cli::print_usage(argv[0]);
        return 1;
    }

    auto config = Config::load_or_defaults(config_file);
    if (!config)
    {
        std::println(stderr, "Invalid configuration: {}", config.error());
        return 1;
    }

    auto log_cfg = config->logging();
    if (auto result = Logger::init(log_cfg.level, log_cfg.file, log_cfg.max_size_mb, log_cfg.enable_console);
        !result)
    {
        std::println(stderr, "Failed to initialize logger: {}", result.error());
        return 1;
    }

    fdp::Codec codec(config->codec_options());

    std::string_view cmd = argv[1];
    std::vector<std::string> rest(argv + 2, argv + argc);

    int status = 1;
    if (cmd == "encode")
    {
        status = cli::cmd_encode(codec, rest);
    }
    else if (cmd == "decode" && rest.size() == 1)
    {
        status = cli::cmd_decode(codec, rest[0]);
    }
    else if (cmd == "verify")
    {
        status = cli::cmd_verify(codec, *config, rest);
    }
    else
    {
        cli::print_usage(argv[0]);
    }

    Logger::shutdown();
    return status;
}
