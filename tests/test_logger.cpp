#include <catch2/catch_test_macros.hpp>

#include "logger.hpp"
#include "packet/codec.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <format>
#include <thread>
#include <atomic>

namespace fs = std::filesystem;

namespace
{

std::string slurp(const fs::path& p)
{
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

TEST_CASE("Logger writes formatted lines at or above the configured level")
{
    const fs::path log_file = "/tmp/test_fdp_logger_levels.log";
    fs::remove(log_file);

    REQUIRE(Logger::init("warn", log_file.string(), 1, false).has_value());

    LOG_INFO("hidden {}", 1);
    LOG_WARN("shown {}", 2);
    LOG_ERROR("also shown {}", fdp::errc::hash_mismatch);
    Logger::shutdown();

    auto text = slurp(log_file);

    CHECK(text.find("hidden") == std::string::npos);
    CHECK(text.find("[WARN] shown 2") != std::string::npos);
    CHECK(text.find("[ERROR] also shown hash_mismatch") != std::string::npos);

    fs::remove(log_file);
    REQUIRE(Logger::init("info", "", 100, false).has_value());
}

TEST_CASE("Logger records codec rejections at debug level")
{
    const fs::path log_file = "/tmp/test_fdp_logger_codec.log";
    fs::remove(log_file);

    REQUIRE(Logger::init("debug", log_file.string(), 1, false).has_value());

    fdp::Codec codec;
    std::vector<std::byte> junk(10);
    CHECK(codec.deserialize(junk).error() == fdp::errc::too_short);
    Logger::shutdown();

    CHECK(slurp(log_file).find("Packet rejected: too_short (10 bytes)") != std::string::npos);

    fs::remove(log_file);
    REQUIRE(Logger::init("info", "", 100, false).has_value());
}

TEST_CASE("Logger rotates the file once it exceeds the size limit")
{
    const fs::path log_file = "/tmp/test_fdp_logger_rotate.log";
    const fs::path rotated = "/tmp/test_fdp_logger_rotate.log.1";
    fs::remove(log_file);
    fs::remove(rotated);

    REQUIRE(Logger::init("info", log_file.string(), 1, false).has_value());

    const std::string filler(200, 'x');
    for (int i = 0; i < 6000; ++i)
    {
        LOG_INFO("{} {}", i, filler);
    }
    Logger::shutdown();

    CHECK(fs::exists(rotated));
    CHECK(fs::file_size(log_file) <= 1024 * 1024);
    CHECK(fs::file_size(rotated) <= 1024 * 1024);
    CHECK(slurp(log_file).find(std::format("5999 {}", filler)) != std::string::npos);

    fs::remove(log_file);
    fs::remove(rotated);
    REQUIRE(Logger::init("info", "", 100, false).has_value());
}

TEST_CASE("Logger::init fails for an unwritable file")
{
    auto res = Logger::init("info", "/nonexistent/dir/fdp.log", 1, false);

    CHECK(!res.has_value());
    REQUIRE(Logger::init("info", "", 100, false).has_value());
}

TEST_CASE("Logger::init rejects an unknown level and keeps the previous one")
{
    REQUIRE(Logger::init("warn", "", 100, false).has_value());

    auto res = Logger::init("verbose", "", 100, false);

    REQUIRE(!res.has_value());
    CHECK(res.error().find("verbose") != std::string::npos);
    CHECK(Logger::level() == Logger::Level::Warn);
    CHECK(Logger::parse_level("WARNING") == Logger::Level::Warn);
    CHECK(!Logger::parse_level("").has_value());

    REQUIRE(Logger::init("info", "", 100, false).has_value());
}

TEST_CASE("Logger level can change while codec workers are logging")
{
    std::atomic<bool> done{false};
    std::atomic<int> wrong{0};
    std::vector<std::jthread> workers;
    for (int t = 0; t < 4; ++t)
    {
        workers.emplace_back([&done, &wrong]
        {
            fdp::Codec codec;
            std::vector<std::byte> junk(10);
            while (!done.load())
            {
                if (codec.deserialize(junk).error() != fdp::errc::too_short)
                {
                    ++wrong;
                }
            }
        });
    }

    for (int i = 0; i < 200; ++i)
    {
        REQUIRE(Logger::init(i % 2 == 0 ? "debug" : "error", "", 100, false).has_value());
    }
    done = true;
    workers.clear();

    CHECK(wrong.load() == 0);
    CHECK(Logger::level() == Logger::Level::Error);
    REQUIRE(Logger::init("info", "", 100, false).has_value());
}
