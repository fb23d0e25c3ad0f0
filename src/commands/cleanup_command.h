// =============================================================================
// numgen - Cleanup Command
// =============================================================================
// Command handler for retention: removes expired artifacts and partitions
// from the store once, or repeatedly with --watch until interrupted.
// =============================================================================

#ifndef NUMGEN_COMMANDS_CLEANUP_COMMAND_H
#define NUMGEN_COMMANDS_CLEANUP_COMMAND_H

#include <chrono>

#include "numgen/common/cancellation.h"
#include "numgen/common/config.h"

namespace numgen::commands {

/// @brief Configuration options for the cleanup command.
struct CleanupOptions {
    /// @brief Store directory, expiry age and sweep interval.
    Config config;

    /// @brief Keep sweeping on a schedule until cancelled.
    bool watch = false;

    bool jsonOutput = false;

    /// @brief Stops watch mode; required when watch is set.
    const CancellationToken* cancellation = nullptr;
};

/// @brief Command handler for retention sweeps.
class CleanupCommand {
public:
    explicit CleanupCommand(CleanupOptions options);

    /// @brief Execute the cleanup command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const CleanupOptions& options() const noexcept { return options_; }

private:
    int runWatch();

    /// @brief Configured expiry as a duration; valid once the config passed validate().
    [[nodiscard]] std::chrono::seconds expiryAge() const;

    CleanupOptions options_;
};

}  // namespace numgen::commands

#endif  // NUMGEN_COMMANDS_CLEANUP_COMMAND_H
