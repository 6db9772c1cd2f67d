// =============================================================================
// rarity-core - Logger Module Implementation
// =============================================================================

#include "rarity/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rarity::log {

namespace {

/// @brief Logger used by the RARITY_LOG_* macros; nullptr until init().
std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gLifecycleMutex;

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                                quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Level Conversion
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

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }
    // A logger needs at least one sink, so the console stays on without a file.
    // Reports own stdout; log lines go to stderr.
    if (config.enableConsole || sinks.empty()) {
        quill::ConsoleSinkConfig consoleConfig;
        consoleConfig.set_stream("stderr");
        sinks.push_back(
            quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console", consoleConfig));
    }

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace rarity::log
