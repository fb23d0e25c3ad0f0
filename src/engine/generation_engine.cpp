// =============================================================================
// numgen - Generation Engine Implementation
// =============================================================================

#include "numgen/engine/generation_engine.h"

#include <chrono>
#include <utility>

#include "numgen/artifact/artifact_partitioner.h"
#include "numgen/artifact/artifact_writer.h"
#include "numgen/artifact/partition_verifier.h"
#include "numgen/common/logger.h"
#include "numgen/common/size_format.h"

namespace numgen::engine {

namespace {

/// @brief Releases a reserved artifact name when the request ends.
class NameReservation {
public:
    NameReservation(artifact::ArtifactStore& store, std::string name)
        : store_(store), name_(std::move(name)) {}

    ~NameReservation() { store_.releaseName(name_); }

    NameReservation(const NameReservation&) = delete;
    NameReservation& operator=(const NameReservation&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    artifact::ArtifactStore& store_;
    std::string name_;
};

}  // namespace

GenerationEngine::GenerationEngine(Config config, lookup::SegmentLookup& lookup)
    : config_(std::move(config)), lookup_(lookup), store_(config_.storeDir) {}

OutputFile GenerationEngine::describe(const std::string& name, std::uint64_t sizeBytes) const {
    OutputFile file;
    file.name = name;
    file.sizeBytes = sizeBytes;
    file.humanSize = formatFileSize(sizeBytes);
    file.relativeDownloadPath = artifact::ArtifactStore::downloadPath(config_.downloadRoute, name);
    return file;
}

Result<GenerationResult> GenerationEngine::run(const gen::RawFilter& raw,
                                               const CancellationToken* cancellation) {
    auto filter = gen::validateFilter(raw, config_.maxCount);
    if (!filter) {
        return makeError<GenerationResult>(filter.error());
    }

    NUMGEN_LOG_INFO("Request: prefix={} province={} city={} suffix={} operators={}",
                    filter->prefix, filter->province, filter->city, filter->suffixToken(),
                    filter->operators.size());

    auto segments =
        lookup_.findSegments(filter->prefix, filter->province, filter->city, filter->operators);
    if (!segments) {
        return makeError<GenerationResult>(ErrorCode::kLookupFailed, segments.error().message());
    }

    GenerationResult result;
    if (segments->empty()) {
        NUMGEN_LOG_INFO("No segments match prefix {} in {}/{}", filter->prefix, filter->province,
                        filter->city);
        return result;
    }

    gen::GenerationSession session(
        gen::SessionOptions{.threads = config_.threads, .cancellation = cancellation});
    auto identifiers = session.generate(*filter, *segments);
    result.stats = session.stats();
    if (!identifiers) {
        return makeError<GenerationResult>(identifiers.error());
    }

    if (auto ready = store_.ensureExists(); !ready) {
        return makeError<GenerationResult>(ready.error());
    }

    NameReservation reservation(
        store_, store_.reserveName(
                    artifact::makeArtifactName(*filter, std::chrono::system_clock::now())));

    artifact::ArtifactWriter writer(store_.root(), cancellation);
    auto written = writer.write(*identifiers, reservation.name());
    if (!written) {
        return makeError<GenerationResult>(written.error());
    }

    result.count = written->lineCount;
    result.artifactName = written->name;

    if (written->sizeBytes <= config_.partitionSizeLimitBytes()) {
        result.files.push_back(describe(written->name, written->sizeBytes));
        NUMGEN_LOG_INFO("Generated {} identifiers into {} ({})", result.count, written->name,
                        formatFileSize(written->sizeBytes));
        return result;
    }

    artifact::ArtifactPartitioner partitioner(config_.partitionLineCeiling);
    auto partitions = partitioner.partition(*written, config_.partitionSizeLimitBytes());
    if (!partitions) {
        NUMGEN_LOG_ERROR("Partitioning {} failed: {}", written->name,
                         partitions.error().message());
        return makeError<GenerationResult>(partitions.error());
    }

    if (config_.verifyPartitions) {
        auto report = artifact::verifyPartitions(*written, *partitions);
        if (!report) {
            store_.removePartitions(*partitions);
            NUMGEN_LOG_ERROR("Partitions of {} failed verification: {}", written->name,
                             report.error().message());
            return makeError<GenerationResult>(report.error());
        }
    }

    result.partitioned = partitions->size() > 1;
    for (const auto& part : *partitions) {
        result.files.push_back(describe(part.name, part.sizeBytes));
    }

    NUMGEN_LOG_INFO("Generated {} identifiers into {} partition(s) of {}", result.count,
                    partitions->size(), written->name);
    return result;
}

}  // namespace numgen::engine
