// =============================================================================
// numgen - Verify Command
// =============================================================================
// Command handler for checking an artifact against its partitions.
//
// This module provides:
// - VerifyCommand: rediscovers part_{n}_{name} files in the store and
//   checks that their concatenation reproduces the artifact
// - VerificationSummary: per-check pass/fail results
// =============================================================================

#ifndef NUMGEN_COMMANDS_VERIFY_COMMAND_H
#define NUMGEN_COMMANDS_VERIFY_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::commands {

// =============================================================================
// Verification Result
// =============================================================================

/// @brief Result of a single verification check.
struct VerificationResult {
    std::string checkName;
    bool passed = false;
    std::string errorMessage;
    std::string details;

    /// @brief Error code to exit with when this check fails.
    ErrorCode failureCode = ErrorCode::kVerificationFailed;
};

/// @brief Overall verification summary.
struct VerificationSummary {
    std::uint32_t totalChecks = 0;
    std::uint32_t passedChecks = 0;
    std::uint32_t failedChecks = 0;
    std::vector<VerificationResult> results;

    [[nodiscard]] bool passed() const noexcept { return failedChecks == 0; }

    void addResult(VerificationResult result) {
        ++totalChecks;
        if (result.passed) {
            ++passedChecks;
        } else {
            ++failedChecks;
        }
        results.push_back(std::move(result));
    }
};

// =============================================================================
// Verify Options
// =============================================================================

/// @brief Configuration options for the verify command.
struct VerifyOptions {
    std::filesystem::path storeDir;

    /// @brief Artifact file name inside the store.
    std::string artifactName;

    /// @brief Also check every partition against this byte budget (MB).
    std::optional<std::uint64_t> partitionSizeLimitMB;

    bool verbose = false;
    bool jsonOutput = false;
};

// =============================================================================
// VerifyCommand Class
// =============================================================================

/// @brief Command handler for partition verification.
class VerifyCommand {
public:
    explicit VerifyCommand(VerifyOptions options);

    ~VerifyCommand();

    VerifyCommand(const VerifyCommand&) = delete;
    VerifyCommand& operator=(const VerifyCommand&) = delete;

    /// @brief Execute the verify command.
    /// @return Exit code (0 = success, 13 = verification failed, 9 = artifact gone).
    [[nodiscard]] int execute();

    [[nodiscard]] const VerificationSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] const VerifyOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] VerificationResult verifyArtifact(Artifact& artifact);
    [[nodiscard]] VerificationResult verifyPartitionSet(std::vector<Partition>& partitions);
    [[nodiscard]] VerificationResult verifyPartitionSizes(const std::vector<Partition>& partitions);
    [[nodiscard]] VerificationResult verifyContent(const Artifact& artifact,
                                                   const std::vector<Partition>& partitions);

    void record(VerificationResult result);
    void printSummary() const;

    VerifyOptions options_;
    VerificationSummary summary_;
};

}  // namespace numgen::commands

#endif  // NUMGEN_COMMANDS_VERIFY_COMMAND_H
