#include "fits/logging.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>

namespace fits {

std::shared_ptr<spdlog::logger> Logger::s_logger;

spdlog::level::level_enum parse_log_level(const std::string& level) {
    if (level == "debug") return spdlog::level::debug;
    if (level == "warning" || level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void Logger::init(const std::filesystem::path& log_file, const std::string& level) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file.string(), 1024 * 1024 * 5, 3); // 5MB, 3 files
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

        s_logger = std::make_shared<spdlog::logger>(
            "fits", spdlog::sinks_init_list{console_sink, file_sink});
        s_logger->set_level(parse_log_level(level));
        s_logger->flush_on(spdlog::level::warn);

        spdlog::register_logger(s_logger);
        spdlog::set_default_logger(s_logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::fprintf(stderr, "Logger init failed: %s\n", ex.what());
    }
}

void Logger::shutdown() {
    if (s_logger) {
        s_logger->flush();
    }
    spdlog::shutdown();
}

} // namespace fits
