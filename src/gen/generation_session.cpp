// =============================================================================
// numgen - Generation Session Implementation
// =============================================================================

#include "numgen/gen/generation_session.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <vector>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

#include "numgen/common/logger.h"
#include "numgen/gen/candidate_expander.h"

namespace numgen::gen {

GenerationSession::GenerationSession(SessionOptions options) : options_(options) {}

Result<IdentifierSet> GenerationSession::generate(const FilterSpec& filter,
                                                  std::span<const SegmentRecord> segments) {
    const auto startTime = std::chrono::steady_clock::now();
    stats_ = SessionStats{};
    stats_.segments = segments.size();

    if (segments.empty()) {
        return IdentifierSet{};
    }

    std::vector<CandidateExpander> expanders;
    expanders.reserve(segments.size());
    for (const auto& segment : segments) {
        auto expander = CandidateExpander::create(segment, filter.exactSuffix4, filter.exactSuffix3);
        if (!expander) {
            return makeError<IdentifierSet>(expander.error());
        }
        expanders.push_back(*expander);
    }

    // Segments sharing a block expand to identical identifiers
    std::sort(expanders.begin(), expanders.end(),
              [](const CandidateExpander& a, const CandidateExpander& b) {
                  return a.blockKey() < b.blockKey();
              });
    expanders.erase(std::unique(expanders.begin(), expanders.end(),
                                [](const CandidateExpander& a, const CandidateExpander& b) {
                                    return a.blockKey() == b.blockKey();
                                }),
                    expanders.end());

    stats_.uniqueBlocks = expanders.size();
    stats_.duplicateSegments = stats_.segments - stats_.uniqueBlocks;
    if (stats_.duplicateSegments > 0) {
        NUMGEN_LOG_DEBUG("Dropped {} segment(s) sharing a region code with another segment",
                         stats_.duplicateSegments);
    }

    const std::size_t perBlock = expanders.front().size();
    const std::uint64_t cardinality = static_cast<std::uint64_t>(expanders.size()) * perBlock;
    if (cardinality > filter.maxCount) {
        return makeError<IdentifierSet>(ErrorCode::kOverCapacity,
                                        OverCapacityError::formatOverCapacity(filter.maxCount,
                                                                              cardinality));
    }

    std::vector<IdentifierKey> keys(cardinality);
    std::atomic<bool> cancelled{false};

    auto expandAll = [&]() {
        tbb::parallel_for(
            tbb::blocked_range<std::size_t>(0, expanders.size()),
            [&](const tbb::blocked_range<std::size_t>& range) {
                for (std::size_t i = range.begin(); i < range.end(); ++i) {
                    if (cancelled.load(std::memory_order_relaxed) ||
                        isCancelled(options_.cancellation)) {
                        cancelled.store(true, std::memory_order_relaxed);
                        return;
                    }
                    expanders[i].expandInto(keys.data() + i * perBlock);
                }
            });
    };

    if (options_.threads > 0) {
        tbb::task_arena arena(static_cast<int>(options_.threads));
        arena.execute(expandAll);
    } else {
        expandAll();
    }

    if (cancelled.load()) {
        return makeError<IdentifierSet>(ErrorCode::kCancelled, "generation cancelled");
    }

    IdentifierSet result = IdentifierSet::freeze(std::move(keys));
    stats_.identifiers = result.size();
    stats_.elapsedSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

    NUMGEN_LOG_DEBUG("Expanded {} block(s) in {} mode into {} identifiers ({:.3f}s)",
                     stats_.uniqueBlocks, expansionModeToString(expanders.front().mode()),
                     stats_.identifiers, stats_.elapsedSeconds);

    return result;
}

}  // namespace numgen::gen
