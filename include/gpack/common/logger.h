// =============================================================================
// gpack - Logger Module
// =============================================================================
// Process-wide Quill logger for the packing library.
//
// Nothing is logged until init() succeeds: before that the GPACK_LOG_*
// macros skip the call entirely, so the codec needs no logging setup.
// Packers log rejected inputs and batch sizes at debug level and never log
// per symbol.
//
// Usage:
//   gpack::log::Config config;
//   config.logFile = "gpack.log";
//   config.level = gpack::log::Level::kDebug;
//   if (auto ok = gpack::log::init(config); !ok) { ... }
//   GPACK_LOG_DEBUG("Packed {} variants", count);
// =============================================================================

#ifndef GPACK_COMMON_LOGGER_H
#define GPACK_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include "gpack/common/error.h"

namespace gpack::log {

/// @brief Minimum severity passed through to the sinks.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Configuration
// =============================================================================

/// @brief Logger settings.
/// @note At least one of logFile / enableConsole must select a sink.
struct Config {
    /// @brief File sink path; empty means no file sink.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Write to stdout as well.
    bool enableConsole = true;

    std::string loggerName = "gpack";

    /// @brief Reject configurations with no sink or no logger name.
    /// @return Success, or kUsageError.
    [[nodiscard]] VoidResult validate() const;

    [[nodiscard]] bool operator==(const Config& other) const = default;
};

// =============================================================================
// Lifecycle
// =============================================================================

/// @brief Start the Quill backend and create the global logger.
/// @return Success, or kUsageError for an invalid config or when a logger
///         with a different config is already running. Re-initializing with
///         the same config is a no-op.
[[nodiscard]] VoidResult init(const Config& config);

/// @brief The global logger, or nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until every queued message has reached the sinks.
void flush();

/// @brief Flush, stop the backend and detach the global logger.
/// @note Quill's backend cannot be restarted, so init() after shutdown()
///       fails with kUsageError.
void shutdown();

// =============================================================================
// Levels
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name ("trace", "debug", "info", "warning", "error",
///        "critical"), case-insensitive.
/// @return Level, or kUsageError for an unknown name.
[[nodiscard]] Result<Level> parseLevel(std::string_view name);

[[nodiscard]] std::string_view levelName(Level level) noexcept;

}  // namespace gpack::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define GPACK_LOG_IMPL_(macro, fmt, ...)                                  \
    do {                                                                  \
        if (quill::Logger* gpackLogger_ = gpack::log::logger()) {         \
            macro(gpackLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                 \
    } while (false)

#define GPACK_LOG_TRACE(fmt, ...) GPACK_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GPACK_LOG_DEBUG(fmt, ...) GPACK_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GPACK_LOG_INFO(fmt, ...) GPACK_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GPACK_LOG_WARNING(fmt, ...) GPACK_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GPACK_LOG_ERROR(fmt, ...) GPACK_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define GPACK_LOG_CRITICAL(fmt, ...) \
    GPACK_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GPACK_COMMON_LOGGER_H
