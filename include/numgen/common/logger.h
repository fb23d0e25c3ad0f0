// =============================================================================
// numgen - Logger Module
// =============================================================================
// Low-latency asynchronous logging using the Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console output and a daily-rotating log file
// - Thread-safe logging (Quill is inherently thread-safe)
//
// Usage:
//   numgen::log::init("logs/numgen.log", numgen::log::Level::kInfo);
//   NUMGEN_LOG_INFO("Generated {} identifiers", count);
// =============================================================================

#ifndef NUMGEN_COMMON_LOGGER_H
#define NUMGEN_COMMON_LOGGER_H

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>

namespace numgen::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Rotate the log file at midnight.
    bool rotateDaily = true;

    /// @brief Number of rotated log files to keep.
    std::size_t maxBackupFiles = 2;

    /// @brief Logger name for identification.
    std::string loggerName = "numgen";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Called once from main() before any worker threads start. A second
///       call is ignored.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger.
/// @note Initializes a console-only logger on first use if init() was not
///       called, so library code may log from tests and tools.
[[nodiscard]] quill::Logger* logger();

/// @brief Shutdown the logging system.
/// @note Flushes pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive; "warn" and "fatal" accepted).
/// @return The level, or nullopt for an unknown name.
[[nodiscard]] std::optional<Level> parseLevel(std::string_view name);

[[nodiscard]] std::string_view levelName(Level level) noexcept;

}  // namespace numgen::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define NUMGEN_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(numgen::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define NUMGEN_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(numgen::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define NUMGEN_LOG_INFO(fmt, ...) \
    LOG_INFO(numgen::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define NUMGEN_LOG_WARNING(fmt, ...) \
    LOG_WARNING(numgen::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define NUMGEN_LOG_ERROR(fmt, ...) \
    LOG_ERROR(numgen::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define NUMGEN_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(numgen::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // NUMGEN_COMMON_LOGGER_H
