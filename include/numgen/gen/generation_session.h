// =============================================================================
// numgen - Generation Session
// =============================================================================
// Expands every matched segment of a request into one frozen IdentifierSet.
//
// Algorithm:
// 1. Build one CandidateExpander per segment.
// 2. Deduplicate segments by block key (prefix + suffix). Distinct blocks
//    expand to disjoint identifier ranges, so this removes exactly the
//    identifiers that two segments sharing a region code would duplicate.
// 3. The deduplicated cardinality is blocks x per-segment cardinality; fail
//    with kOverCapacity before allocating anything when it exceeds maxCount.
// 4. Expand the blocks in parallel (TBB), each into its own slice of one
//    preallocated buffer. Blocks are sorted, so the buffer is ascending.
// 5. Freeze the buffer into an IdentifierSet.
//
// Cancellation is polled before each segment expansion.
// =============================================================================

#ifndef NUMGEN_GEN_GENERATION_SESSION_H
#define NUMGEN_GEN_GENERATION_SESSION_H

#include <cstddef>
#include <cstdint>
#include <span>

#include "numgen/common/cancellation.h"
#include "numgen/common/error.h"
#include "numgen/common/types.h"
#include "numgen/gen/identifier_set.h"

namespace numgen::gen {

/// @brief Options for a generation session.
struct SessionOptions {
    /// @brief Worker threads (0 = automatic).
    std::size_t threads = 0;

    /// @brief Optional caller-owned cancellation signal.
    const CancellationToken* cancellation = nullptr;
};

/// @brief Statistics from the last generate() call.
struct SessionStats {
    /// @brief Segments passed in.
    std::uint64_t segments = 0;

    /// @brief Distinct (prefix, suffix) blocks after deduplication.
    std::uint64_t uniqueBlocks = 0;

    /// @brief Segments dropped as duplicates of another block.
    std::uint64_t duplicateSegments = 0;

    /// @brief Identifiers in the frozen set.
    std::uint64_t identifiers = 0;

    /// @brief Wall time spent in generate().
    double elapsedSeconds = 0.0;
};

class GenerationSession {
public:
    explicit GenerationSession(SessionOptions options = {});

    /// @brief Generate the identifier set for a filter and its matched segments.
    /// @param filter Validated filter; its exact suffixes select the expansion
    ///        mode and maxCount bounds the result.
    /// @param segments Segments resolved for the filter.
    /// @return The frozen set (empty for no segments), or kOverCapacity,
    ///         kCancelled or kInvalidArgument (malformed segment).
    [[nodiscard]] Result<IdentifierSet> generate(const FilterSpec& filter,
                                                 std::span<const SegmentRecord> segments);

    [[nodiscard]] const SessionStats& stats() const noexcept { return stats_; }

    [[nodiscard]] const SessionOptions& options() const noexcept { return options_; }

private:
    SessionOptions options_;
    SessionStats stats_;
};

}  // namespace numgen::gen

#endif  // NUMGEN_GEN_GENERATION_SESSION_H
