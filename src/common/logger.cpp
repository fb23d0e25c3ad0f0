// =============================================================================
// numgen - Logger Module Implementation
// =============================================================================

#include "numgen/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>

namespace numgen::log {

namespace {

struct LevelEntry {
    std::string_view name;
    Level level;
    quill::LogLevel quillLevel;
};

constexpr std::array<LevelEntry, 6> kLevels = {{
    {"trace", Level::kTrace, quill::LogLevel::TraceL1},
    {"debug", Level::kDebug, quill::LogLevel::Debug},
    {"info", Level::kInfo, quill::LogLevel::Info},
    {"warning", Level::kWarning, quill::LogLevel::Warning},
    {"error", Level::kError, quill::LogLevel::Error},
    {"critical", Level::kCritical, quill::LogLevel::Critical},
}};

const LevelEntry& entryFor(Level level) noexcept {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[2];
}

/// @brief Logger in use; null until init() or the first logger() call.
std::atomic<quill::Logger*> gLogger{nullptr};

std::mutex gInitMutex;

std::shared_ptr<quill::Sink> makeFileSink(const Config& config) {
    const std::filesystem::path parent = std::filesystem::path(config.logFile).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        // On failure the sink constructor below reports the open error
    }

    quill::RotatingFileSinkConfig sinkConfig;
    sinkConfig.set_open_mode('a');
    if (config.rotateDaily) {
        sinkConfig.set_rotation_time_daily("00:00");
    }
    sinkConfig.set_max_backup_files(static_cast<std::uint32_t>(config.maxBackupFiles));

    return quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
        config.logFile, sinkConfig, quill::FileEventNotifier{});
}

}  // namespace

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    return entryFor(level).quillLevel;
}

std::string_view levelName(Level level) noexcept {
    return entryFor(level).name;
}

std::optional<Level> parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "fatal") {
        return Level::kCritical;
    }
    for (const auto& entry : kLevels) {
        if (entry.name == lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config));
    }
    // Console output is forced when there is nowhere else to write
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire)) {
        return current;
    }
    Config fallback;
    fallback.level = Level::kWarning;
    init(fallback);
    return gLogger.load(std::memory_order_acquire);
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace numgen::log
