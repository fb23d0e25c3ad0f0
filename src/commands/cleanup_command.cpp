// =============================================================================
// numgen - Cleanup Command Implementation
// =============================================================================

#include "cleanup_command.h"

#include <iostream>
#include <thread>
#include <utility>

#include "command_output.h"
#include "numgen/artifact/artifact_retention.h"
#include "numgen/common/logger.h"

namespace numgen::commands {

namespace {

/// @brief How often watch mode checks for cancellation.
constexpr auto kWatchPollInterval = std::chrono::milliseconds(200);

}  // namespace

CleanupCommand::CleanupCommand(CleanupOptions options) : options_(std::move(options)) {}

int CleanupCommand::execute() {
    if (auto valid = options_.config.validate(); !valid) {
        return reportFailure("cleanup", valid.error());
    }
    if (options_.watch) {
        return runWatch();
    }

    const Config& config = options_.config;
    artifact::ArtifactRetention retention(config.storeDir);
    const std::uint64_t deleted = retention.sweep(expiryAge());

    if (options_.jsonOutput) {
        std::cout << "{\"store\": " << jsonString(config.storeDir.string())
                  << ", \"deleted\": " << deleted << "}" << std::endl;
    } else {
        std::cout << "Removed " << deleted << " expired file(s) from "
                  << config.storeDir.string() << std::endl;
    }
    return toExitCode(ErrorCode::kSuccess);
}

int CleanupCommand::runWatch() {
    if (options_.cancellation == nullptr) {
        return reportFailure("cleanup", Error(ErrorCode::kUsageError,
                                              "watch mode needs a cancellation signal"));
    }

    const Config& config = options_.config;
    artifact::ArtifactRetention retention(config.storeDir);
    artifact::RetentionScheduler scheduler(retention, expiryAge(),
                                           std::chrono::minutes(config.sweepIntervalMinutes));

    NUMGEN_LOG_INFO("Watching {} (expiry {}h, every {}min); press Ctrl-C to stop",
                    config.storeDir.string(), config.artifactExpiryHours,
                    config.sweepIntervalMinutes);
    scheduler.start();
    while (!options_.cancellation->isCancelled()) {
        std::this_thread::sleep_for(kWatchPollInterval);
    }
    scheduler.stop();

    if (options_.jsonOutput) {
        std::cout << "{\"store\": " << jsonString(config.storeDir.string())
                  << ", \"sweeps\": " << scheduler.sweepsCompleted()
                  << ", \"deleted\": " << scheduler.filesDeleted() << "}" << std::endl;
    } else {
        std::cout << "Stopped after " << scheduler.sweepsCompleted() << " sweep(s), removed "
                  << scheduler.filesDeleted() << " file(s)" << std::endl;
    }
    return toExitCode(ErrorCode::kSuccess);
}

std::chrono::seconds CleanupCommand::expiryAge() const {
    return std::chrono::seconds(
        static_cast<std::chrono::seconds::rep>(options_.config.artifactExpirySeconds()));
}

}  // namespace numgen::commands
