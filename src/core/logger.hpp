#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace chronoring::core
{
    /// @brief Centralized logging facility for Chronoring.
    ///
    /// Provides two separate loggers:
    /// - **CHRONORING** (core): engine internals, time sync, calculators
    /// - **APP**: command-line front end, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// @param level Minimum level for both loggers.
        /// @param file_name Rotating log file path.
        /// Must be called once at startup before any CHR_ macros are used.
        static void init(spdlog::level::level_enum level = spdlog::level::trace,
                         const std::string& file_name = "chronoring.log");

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("CHRONORING").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace chronoring::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define CHR_CORE_TRACE(...)    ::chronoring::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define CHR_CORE_DEBUG(...)    ::chronoring::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define CHR_CORE_INFO(...)     ::chronoring::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define CHR_CORE_WARN(...)     ::chronoring::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define CHR_CORE_ERROR(...)    ::chronoring::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define CHR_CORE_CRITICAL(...) ::chronoring::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define CHR_TRACE(...)         ::chronoring::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define CHR_INFO(...)          ::chronoring::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define CHR_WARN(...)          ::chronoring::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define CHR_ERROR(...)         ::chronoring::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define CHR_CRITICAL(...)      ::chronoring::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
