/// @file logger.cpp
/// @brief Logger implementation: two spdlog loggers sharing console and rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace planetrender::core
{

std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

std::shared_ptr<spdlog::logger> make_logger(const char* name, const std::vector<spdlog::sink_ptr>& sinks)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

} // anonymous namespace

void Logger::init()
{
    if (s_core_logger)
    {
        return;
    }

    // -----------------------------------------------------------------
    // Shared sinks
    // -----------------------------------------------------------------
    constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    // Rotating file sink: 5 MB max size, 3 rotated files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "planetrender.log", kMaxFileSize, kMaxFiles);
    file_sink->set_pattern(kPattern);

    const std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    s_core_logger = make_logger("PLANETRENDER", sinks);
    s_app_logger = make_logger("APP", sinks);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace planetrender::core
