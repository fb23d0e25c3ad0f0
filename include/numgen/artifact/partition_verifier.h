// =============================================================================
// numgen - Partition Verifier
// =============================================================================
// Checks that a partition sequence reproduces its source artifact.
//
// The artifact and the partitions (in sequence order) are streamed through
// two XXH64 states; the digests, total byte counts and line counts must all
// agree. A pass-through sequence (a single partition that is the artifact
// itself) verifies without reading the file twice.
// =============================================================================

#ifndef NUMGEN_ARTIFACT_PARTITION_VERIFIER_H
#define NUMGEN_ARTIFACT_PARTITION_VERIFIER_H

#include <cstddef>
#include <cstdint>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::artifact {

/// @brief Seed used for all verification digests.
inline constexpr std::uint64_t kVerifySeed = 0;

/// @brief Outcome of a successful verification.
struct VerificationReport {
    std::uint64_t artifactDigest = 0;
    std::uint64_t partitionsDigest = 0;
    std::uint64_t artifactBytes = 0;
    std::uint64_t partitionBytes = 0;
    std::uint64_t artifactLines = 0;
    std::uint64_t partitionLines = 0;
    std::size_t partitionCount = 0;

    /// @brief True when the artifact was passed through unsplit.
    bool passThrough = false;
};

/// @brief Verify partitions against their artifact.
/// @return The report, kVerificationFailed on any mismatch (the message
///         names the first mismatch), or kArtifactExpired / kSourceUnreadable
///         if a file cannot be read.
[[nodiscard]] Result<VerificationReport> verifyPartitions(const Artifact& artifact,
                                                          const std::vector<Partition>& partitions);

}  // namespace numgen::artifact

#endif  // NUMGEN_ARTIFACT_PARTITION_VERIFIER_H
