// =============================================================================
// rarity-core - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console (stderr) and file output
// - Thread-safe logging (scorers log from TBB worker threads)
//
// Usage:
//   rarity::log::init("rarity.log", rarity::log::Level::kInfo);
//   RARITY_LOG_INFO("Scored {} items", count);
//
// The RARITY_LOG_* macros are no-ops until init() has been called, so the
// library can be used without configuring logging.
// =============================================================================

#ifndef RARITY_COMMON_LOGGER_H
#define RARITY_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace rarity::log {

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

    /// @brief Logger name for identification.
    std::string loggerName = "rarity";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Call once at application startup; repeated calls are ignored.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert rarity::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace rarity::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define RARITY_LOG_IMPL_(quillMacro, fmt, ...)                                   \
    do {                                                                         \
        if (quill::Logger* rarityLogger_ = ::rarity::log::logger()) {            \
            quillMacro(rarityLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);           \
        }                                                                        \
    } while (false)

/// @brief Log a trace message.
#define RARITY_LOG_TRACE(fmt, ...) \
    RARITY_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define RARITY_LOG_DEBUG(fmt, ...) \
    RARITY_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define RARITY_LOG_INFO(fmt, ...) \
    RARITY_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define RARITY_LOG_WARNING(fmt, ...) \
    RARITY_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define RARITY_LOG_ERROR(fmt, ...) \
    RARITY_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define RARITY_LOG_CRITICAL(fmt, ...) \
    RARITY_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // RARITY_COMMON_LOGGER_H
