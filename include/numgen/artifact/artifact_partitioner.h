// =============================================================================
// numgen - Artifact Partitioner
// =============================================================================
// Splits a written artifact into ordered, line-aligned partition files.
//
// Two independent bounds close a partition, whichever is reached first:
// - the buffered byte count (terminators included) reaches maxPartBytes
// - the buffered line count reaches the soft line ceiling
//
// Both checks run only after a complete line has been buffered, so a
// partition overshoots maxPartBytes by at most the line that triggered the
// flush. Partitions are named part_{n}_{artifactName}, n from 1, and are
// written beside the artifact. A partition name that already exists is never
// overwritten; it fails the split with kDestinationUnwritable. On any failure
// the partitions written so far are deleted.
//
// An artifact at or below maxPartBytes passes through as a single partition
// wrapping the artifact itself. An empty artifact yields no partitions.
// =============================================================================

#ifndef NUMGEN_ARTIFACT_ARTIFACT_PARTITIONER_H
#define NUMGEN_ARTIFACT_ARTIFACT_PARTITIONER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::artifact {

/// @brief Bytes read from the source per read() call.
inline constexpr std::size_t kPartitionReadChunkBytes = 1 << 20;

/// @brief Build the name of the @p sequenceIndex-th partition of an artifact.
[[nodiscard]] std::string makePartitionName(std::uint32_t sequenceIndex,
                                            std::string_view artifactName);

class ArtifactPartitioner {
public:
    /// @brief Construct a partitioner.
    /// @param lineCeiling Soft per-partition line ceiling (must be > 0).
    explicit ArtifactPartitioner(std::size_t lineCeiling = kDefaultPartitionLineCeiling);

    /// @brief Partition an artifact.
    /// @param artifact Artifact previously produced by ArtifactWriter.
    /// @param maxPartBytes Per-partition byte budget.
    /// @return Partitions in sequence order, or:
    ///         - kInvalidArgument for a zero budget or line ceiling
    ///         - kArtifactExpired if the source no longer exists
    ///         - kSourceUnreadable if the source cannot be opened or read
    ///         - kDestinationUnwritable / kDiskExhausted if a partition fails
    /// @note Partitions written before a failure are left on disk; the caller
    ///       discards them.
    [[nodiscard]] Result<std::vector<Partition>> partition(const Artifact& artifact,
                                                           std::uint64_t maxPartBytes) const;

    [[nodiscard]] std::size_t lineCeiling() const noexcept { return lineCeiling_; }

private:
    std::size_t lineCeiling_;
};

}  // namespace numgen::artifact

#endif  // NUMGEN_ARTIFACT_ARTIFACT_PARTITIONER_H
