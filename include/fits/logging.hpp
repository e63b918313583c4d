#pragma once

#include <spdlog/spdlog.h>
#include <filesystem>
#include <memory>
#include <string>

namespace fits {

// Falls back to spdlog's default logger until init() runs.
class Logger {
public:
    static void init(const std::filesystem::path& log_file,
                     const std::string& level = "info");
    static void shutdown();

    static std::shared_ptr<spdlog::logger> get() {
        return s_logger ? s_logger : spdlog::default_logger();
    }

    template<typename... Args>
    static void debug(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warn(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(fmt::format_string<Args...> fmt, Args&&... args) {
        get()->error(fmt, std::forward<Args>(args)...);
    }

private:
    static std::shared_ptr<spdlog::logger> s_logger;
};

spdlog::level::level_enum parse_log_level(const std::string& level);

#define LOG_DEBUG(...) fits::Logger::debug(__VA_ARGS__)
#define LOG_INFO(...)  fits::Logger::info(__VA_ARGS__)
#define LOG_WARN(...)  fits::Logger::warn(__VA_ARGS__)
#define LOG_ERROR(...) fits::Logger::error(__VA_ARGS__)

} // namespace fits
