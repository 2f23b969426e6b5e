// =============================================================================
// gpack - Logger Module Implementation
// =============================================================================

#include "gpack/common/logger.h"

#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace gpack::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gLifecycleMutex;

/// @brief Config of the running logger. Guarded by gLifecycleMutex.
std::optional<Config> gActiveConfig;

/// @brief Set once the backend has been stopped; Quill cannot restart it.
bool gBackendStopped = false;

constexpr std::array<std::pair<std::string_view, Level>, 6> kLevelNames = {{
    {"trace", Level::kTrace},
    {"debug", Level::kDebug},
    {"info", Level::kInfo},
    {"warning", Level::kWarning},
    {"error", Level::kError},
    {"critical", Level::kCritical},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    return sinks;
}

}  // namespace

// =============================================================================
// Config
// =============================================================================

VoidResult Config::validate() const {
    if (loggerName.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "logger name must not be empty");
    }
    if (logFile.empty() && !enableConsole) {
        return makeVoidError(ErrorCode::kUsageError,
                             "logger needs a file path or console output");
    }
    return makeVoidSuccess();
}

// =============================================================================
// Lifecycle
// =============================================================================

VoidResult init(const Config& config) {
    if (auto ok = config.validate(); !ok) {
        return ok;
    }

    std::lock_guard<std::mutex> lock(gLifecycleMutex);

    if (gActiveConfig.has_value()) {
        if (*gActiveConfig == config) {
            return makeVoidSuccess();
        }
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("logger '{}' is already running",
                                         gActiveConfig->loggerName));
    }
    if (gBackendStopped) {
        return makeVoidError(ErrorCode::kUsageError,
                             "logging backend was shut down and cannot be restarted");
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(toQuillLevel(config.level));

    gActiveConfig = config;
    gLogger.store(created, std::memory_order_release);
    return makeVoidSuccess();
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (!gActiveConfig.has_value()) {
        return;
    }

    flush();
    gLogger.store(nullptr, std::memory_order_release);
    quill::Backend::stop();

    gActiveConfig.reset();
    gBackendStopped = true;
}

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Result<Level> parseLevel(std::string_view name) {
    for (const auto& [text, level] : kLevelNames) {
        if (equalsIgnoreCase(name, text)) {
            return level;
        }
    }
    return makeError<Level>(ErrorCode::kUsageError,
                            fmt::format("unknown log level '{}'", name),
                            ErrorContext{"level"});
}

std::string_view levelName(Level level) noexcept {
    for (const auto& [text, value] : kLevelNames) {
        if (value == level) {
            return text;
        }
    }
    return "info";
}

}  // namespace gpack::log
