#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <print>

namespace fs = std::filesystem;

Logger::State& Logger::instance()
{
    static State s;
    return s;
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name)
{
    std::string lower;
    lower.reserve(name.size());
    std::ranges::transform(name, std::back_inserter(lower),
                           [](unsigned char c){ return std::tolower(c); });
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return std::nullopt;
}

std::expected<void, std::string> Logger::FileSink::open(std::string_view p, size_t limit_bytes)
{
    close();
    path = std::string(p);
    limit = limit_bytes;
    if (path.empty())
    {
        return {};
    }

    out.open(path, std::ios::app);
    if (!out.is_open())
    {
        return std::unexpected("Failed to open log file: " + path);
    }
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    written = ec ? 0 : static_cast<size_t>(sz);
    return {};
}

void Logger::FileSink::append(std::string_view line)
{
    if (!out.is_open())
    {
        return;
    }
    if (written + line.size() + 1 > limit)
    {
        rotate();
    }
    std::println(out, "{}", line);
    out.flush();
    written += line.size() + 1;
}

void Logger::FileSink::close()
{
    if (out.is_open())
    {
        out.close();
    }
    written = 0;
}

void Logger::FileSink::rotate()
{
    out.close();
    std::error_code ec;
    fs::rename(path, path + ".1", ec);
    if (ec)
    {
        std::println(stderr, "Log rotation failed for {}: {}", path, ec.message());
    }
    out.open(path, std::ios::trunc);
    written = 0;
}

std::expected<void, std::string> Logger::init(std::string_view level,
                                               std::string_view file,
                                               size_t max_size_mb,
                                               bool enable_console)
{
    auto lvl = parse_level(level);
    if (!lvl)
    {
        return std::unexpected(std::format("Unknown log level: {}", level));
    }

    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.console = enable_console;
    auto opened = s.sink.open(file, max_size_mb * 1024 * 1024);
    s.lvl.store(*lvl, std::memory_order_relaxed);
    return opened;
}

void Logger::shutdown()
{
    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.sink.close();
}

void Logger::emit(Level l, std::string_view msg)
{
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    std::string line = std::format("[{:%F %T}] [{}] {}", now, l, msg);

    State& s = instance();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.console)
    {
        std::println(l == Level::Error ? stderr : stdout, "{}", line);
    }
    s.sink.append(line);
}
