#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <expected>
#include <format>

class Logger
{
public:
    enum class Level : uint8_t { Debug, Info, Warn, Error };

    // Reconfigures the process-wide logger. An unknown level name is an error
    // and leaves the previous configuration in place.
    [[nodiscard]] static std::expected<void, std::string> init(std::string_view level,
                                                                std::string_view file,
                                                                size_t max_size_mb,
                                                                bool enable_console);
    static void shutdown();

    static std::optional<Level> parse_level(std::string_view name);
    static Level level() { return instance().lvl.load(std::memory_order_relaxed); }
    static bool enabled(Level l) { return level() <= l; }

    template<typename... Args>
    static void write(Level l, std::format_string<Args...> fmt, Args&&... args)
    {
        if (enabled(l))
        {
            emit(l, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    static void debug(std::format_string<Args...> fmt, Args&&... args) { write(Level::Debug, fmt, std::forward<Args>(args)...); }

    template<typename... Args>
    static void info(std::format_string<Args...> fmt, Args&&... args) { write(Level::Info, fmt, std::forward<Args>(args)...); }

    template<typename... Args>
    static void warn(std::format_string<Args...> fmt, Args&&... args) { write(Level::Warn, fmt, std::forward<Args>(args)...); }

    template<typename... Args>
    static void error(std::format_string<Args...> fmt, Args&&... args) { write(Level::Error, fmt, std::forward<Args>(args)...); }

private:
    // Size-bounded file sink; one previous generation is kept as <path>.1
    struct FileSink
    {
        std::ofstream out;
        std::string path;
        size_t limit = 100 * 1024 * 1024;
        size_t written = 0;

        std::expected<void, std::string> open(std::string_view p, size_t limit_bytes);
        void append(std::string_view line);
        void close();

    private:
        void rotate();
    };

    struct State
    {
        std::atomic<Level> lvl{Level::Info};
        std::mutex mtx;
        bool console = true;
        FileSink sink;
    };

    static State& instance();
    static void emit(Level l, std::string_view msg);
};

template<>
struct std::formatter<Logger::Level> : std::formatter<std::string_view>
{
    auto format(Logger::Level l, std::format_context& ctx) const
    {
        constexpr std::string_view names[] = {"DEBUG", "INFO", "WARN", "ERROR"};
        return std::formatter<std::string_view>::format(names[static_cast<size_t>(l)], ctx);
    }
};

#define LOG_DEBUG(...) Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) Logger::error(__VA_ARGS__)
