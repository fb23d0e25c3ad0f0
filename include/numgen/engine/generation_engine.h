// =============================================================================
// numgen - Generation Engine
// =============================================================================
// Runs one generation request from raw filter to output file descriptors.
//
// Pipeline:
//   validateFilter -> SegmentLookup::findSegments -> GenerationSession
//     -> ArtifactWriter -> ArtifactPartitioner (oversized artifacts only)
//     -> verifyPartitions (optional)
//
// A request that matches no segments returns an empty result (count 0, no
// files) rather than an error. When partitioning or verification fails the
// partitions already written are removed and the artifact is kept.
// =============================================================================

#ifndef NUMGEN_ENGINE_GENERATION_ENGINE_H
#define NUMGEN_ENGINE_GENERATION_ENGINE_H

#include <cstdint>
#include <string>
#include <vector>

#include "numgen/artifact/artifact_store.h"
#include "numgen/common/cancellation.h"
#include "numgen/common/config.h"
#include "numgen/common/error.h"
#include "numgen/gen/filter_validator.h"
#include "numgen/gen/generation_session.h"
#include "numgen/lookup/segment_lookup.h"

namespace numgen::engine {

/// @brief One file the caller can fetch.
struct OutputFile {
    std::string name;

    /// @brief Human-readable size, e.g. "2.00 KB".
    std::string humanSize;

    /// @brief Download route joined with the file name.
    std::string relativeDownloadPath;

    std::uint64_t sizeBytes = 0;
};

/// @brief Outcome of a generation request.
struct GenerationResult {
    /// @brief Identifiers generated.
    std::uint64_t count = 0;

    /// @brief The artifact, or its partitions in sequence order.
    std::vector<OutputFile> files;

    /// @brief Name of the artifact the files were derived from (empty for no matches).
    std::string artifactName;

    /// @brief True when the artifact was split into several partitions.
    bool partitioned = false;

    /// @brief Expansion statistics of the session.
    gen::SessionStats stats;

    /// @brief True when the request matched no segments.
    [[nodiscard]] bool noMatches() const noexcept { return count == 0 && files.empty(); }
};

class GenerationEngine {
public:
    /// @brief Construct an engine.
    /// @param config Validated configuration.
    /// @param lookup Segment source; must outlive the engine.
    GenerationEngine(Config config, lookup::SegmentLookup& lookup);

    /// @brief Run one request.
    /// @param raw Filter as entered by the user.
    /// @param cancellation Optional caller-owned cancellation signal.
    [[nodiscard]] Result<GenerationResult> run(const gen::RawFilter& raw,
                                               const CancellationToken* cancellation = nullptr);

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] artifact::ArtifactStore& store() noexcept { return store_; }

private:
    [[nodiscard]] OutputFile describe(const std::string& name, std::uint64_t sizeBytes) const;

    Config config_;
    lookup::SegmentLookup& lookup_;
    artifact::ArtifactStore store_;
};

}  // namespace numgen::engine

#endif  // NUMGEN_ENGINE_GENERATION_ENGINE_H
