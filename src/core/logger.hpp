#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace planetrender::core
{
    /// @brief Centralized logging facility for planetrender.
    ///
    /// Provides two separate loggers:
    /// - **PLANETRENDER** (core): rasterizer, rings, satellites, cache, texture I/O
    /// - **APP**: command line tool and interactive viewer
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any PLR_ macros are used.
        static void init();

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the engine-internal logger ("PLANETRENDER").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace planetrender::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define PLR_CORE_TRACE(...)    ::planetrender::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define PLR_CORE_DEBUG(...)    ::planetrender::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define PLR_CORE_INFO(...)     ::planetrender::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define PLR_CORE_WARN(...)     ::planetrender::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define PLR_CORE_ERROR(...)    ::planetrender::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define PLR_CORE_CRITICAL(...) ::planetrender::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define PLR_TRACE(...)         ::planetrender::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define PLR_INFO(...)          ::planetrender::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define PLR_WARN(...)          ::planetrender::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define PLR_ERROR(...)         ::planetrender::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define PLR_CRITICAL(...)      ::planetrender::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
