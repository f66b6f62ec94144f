// =============================================================================
// dnac - Logger Module
// =============================================================================
// Asynchronous logging using the Quill library.
//
// The library logs through the DNAC_LOG_* macros. Until init() is called the
// macros do nothing, so embedding callers and unit tests need no setup.
//
// Usage:
//   dnac::log::init("dnac.log", dnac::log::Level::kInfo);
//   DNAC_LOG_INFO("encoded {} chunks", count);
// =============================================================================

#ifndef DNAC_COMMON_LOGGER_H
#define DNAC_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace dnac::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kWarning;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "dnac";
};

/// @brief Initialize the global logger.
/// @note Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief Initialize the global logger with a file and a level.
void init(std::string_view logFile = "", Level level = Level::kWarning);

/// @brief Get the global logger instance, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until all queued messages are written.
void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive). Unknown names map to kInfo.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Map the CLI verbosity flags to a level.
/// @param verbosity Number of -v flags given.
/// @param quiet True when -q was given; wins over verbosity.
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace dnac::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define DNAC_LOG_IMPL(macro, fmt, ...)                                  \
    do {                                                                \
        if (quill::Logger* dnacLogger_ = ::dnac::log::logger()) {       \
            macro(dnacLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);         \
        }                                                               \
    } while (false)

#define DNAC_LOG_TRACE(fmt, ...) DNAC_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define DNAC_LOG_DEBUG(fmt, ...) DNAC_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define DNAC_LOG_INFO(fmt, ...) DNAC_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define DNAC_LOG_WARNING(fmt, ...) DNAC_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define DNAC_LOG_ERROR(fmt, ...) DNAC_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define DNAC_LOG_CRITICAL(fmt, ...) DNAC_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // DNAC_COMMON_LOGGER_H
