// =============================================================================
// numgen - Verify Command Implementation
// =============================================================================

#include "verify_command.h"

#include <iostream>
#include <utility>

#include <fmt/format.h>

#include "command_output.h"
#include "numgen/artifact/artifact_store.h"
#include "numgen/artifact/partition_verifier.h"
#include "numgen/common/logger.h"
#include "numgen/common/size_format.h"

namespace numgen::commands {

VerifyCommand::VerifyCommand(VerifyOptions options) : options_(std::move(options)) {}

VerifyCommand::~VerifyCommand() = default;

int VerifyCommand::execute() {
    if (options_.verbose && !options_.jsonOutput) {
        std::cout << "Verifying: " << options_.artifactName << std::endl << std::endl;
    }

    Artifact artifact;
    std::vector<Partition> partitions;

    // Each check needs the previous one to have passed
    record(verifyArtifact(artifact));
    if (summary_.passed()) {
        record(verifyPartitionSet(partitions));
    }
    if (summary_.passed() && options_.partitionSizeLimitMB.has_value()) {
        record(verifyPartitionSizes(partitions));
    }
    if (summary_.passed()) {
        record(verifyContent(artifact, partitions));
    }

    printSummary();

    for (const auto& result : summary_.results) {
        if (!result.passed) {
            NUMGEN_LOG_ERROR("Verification of {} failed at '{}': {}", options_.artifactName,
                             result.checkName, result.errorMessage);
            return toExitCode(result.failureCode);
        }
    }
    return toExitCode(ErrorCode::kSuccess);
}

void VerifyCommand::record(VerificationResult result) {
    if (options_.verbose && !options_.jsonOutput) {
        std::cout << "[" << (result.passed ? "PASS" : "FAIL") << "] " << result.checkName;
        if (!result.passed) {
            std::cout << ": " << result.errorMessage;
        } else if (!result.details.empty()) {
            std::cout << " (" << result.details << ")";
        }
        std::cout << std::endl;
    }
    summary_.addResult(std::move(result));
}

VerificationResult VerifyCommand::verifyArtifact(Artifact& artifact) {
    VerificationResult result;
    result.checkName = "Artifact";

    artifact::ArtifactStore store(options_.storeDir);
    auto loaded = store.load(options_.artifactName);
    if (!loaded) {
        result.errorMessage = loaded.error().message();
        result.failureCode = loaded.error().code();
        return result;
    }
    artifact = std::move(*loaded);

    result.passed = true;
    result.details = fmt::format("{} lines, {}", artifact.lineCount,
                                 formatFileSize(artifact.sizeBytes));
    return result;
}

VerificationResult VerifyCommand::verifyPartitionSet(std::vector<Partition>& partitions) {
    VerificationResult result;
    result.checkName = "Partitions";

    artifact::ArtifactStore store(options_.storeDir);
    auto found = store.findPartitions(options_.artifactName);
    if (!found) {
        result.errorMessage = found.error().message();
        result.failureCode = found.error().code();
        return result;
    }
    partitions = std::move(*found);

    result.passed = true;
    result.details = partitions.empty() ? "none (artifact not split)"
                                        : fmt::format("{} found", partitions.size());
    return result;
}

VerificationResult VerifyCommand::verifyPartitionSizes(const std::vector<Partition>& partitions) {
    VerificationResult result;
    result.checkName = "Partition Sizes";

    const std::uint64_t budget = *options_.partitionSizeLimitMB * kBytesPerMB;
    for (const auto& part : partitions) {
        // One line of overshoot is allowed
        if (part.sizeBytes > budget + kArtifactLineBytes) {
            result.errorMessage = fmt::format("{} holds {} bytes, budget is {}", part.name,
                                              part.sizeBytes, budget);
            return result;
        }
    }

    result.passed = true;
    result.details = fmt::format("all within {}", formatFileSize(budget));
    return result;
}

VerificationResult VerifyCommand::verifyContent(const Artifact& artifact,
                                                const std::vector<Partition>& partitions) {
    VerificationResult result;
    result.checkName = "Checksum";

    if (partitions.empty()) {
        result.passed = true;
        result.details = "skipped, nothing to compare";
        return result;
    }

    auto report = artifact::verifyPartitions(artifact, partitions);
    if (!report) {
        result.errorMessage = report.error().message();
        result.failureCode = report.error().code();
        return result;
    }

    result.passed = true;
    result.details = fmt::format("xxh64 {:016x}", report->artifactDigest);
    return result;
}

void VerifyCommand::printSummary() const {
    if (options_.jsonOutput) {
        std::cout << "{" << std::endl;
        std::cout << "  \"artifact\": " << jsonString(options_.artifactName) << "," << std::endl;
        std::cout << "  \"passed\": " << (summary_.passed() ? "true" : "false") << ","
                  << std::endl;
        std::cout << "  \"checks\": [";
        for (std::size_t i = 0; i < summary_.results.size(); ++i) {
            const auto& r = summary_.results[i];
            std::cout << (i == 0 ? "" : ",") << std::endl;
            std::cout << "    {\"name\": " << jsonString(r.checkName)
                      << ", \"passed\": " << (r.passed ? "true" : "false")
                      << ", \"detail\": " << jsonString(r.passed ? r.details : r.errorMessage)
                      << "}";
        }
        std::cout << std::endl << "  ]" << std::endl;
        std::cout << "}" << std::endl;
        return;
    }

    std::cout << "Checks: " << summary_.passedChecks << "/" << summary_.totalChecks << " passed"
              << std::endl;
    std::cout << "Result: " << (summary_.passed() ? "OK" : "FAILED") << std::endl;
}

}  // namespace numgen::commands
