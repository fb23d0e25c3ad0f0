// =============================================================================
// numgen - Partition Verifier Implementation
// =============================================================================

#include "numgen/artifact/partition_verifier.h"

#include <fstream>
#include <system_error>

#include <fmt/format.h>
#include <xxhash.h>

#include "numgen/artifact/artifact_partitioner.h"
#include "numgen/common/logger.h"

namespace numgen::artifact {

namespace {

/// @brief Owning wrapper for an XXH64 streaming state.
class Xxh64Stream {
public:
    Xxh64Stream() : state_(XXH64_createState()) {
        if (state_ != nullptr) {
            XXH64_reset(state_, kVerifySeed);
        }
    }

    ~Xxh64Stream() {
        if (state_ != nullptr) {
            XXH64_freeState(state_);
        }
    }

    Xxh64Stream(const Xxh64Stream&) = delete;
    Xxh64Stream& operator=(const Xxh64Stream&) = delete;

    [[nodiscard]] bool valid() const noexcept { return state_ != nullptr; }

    void update(const char* data, std::size_t size) {
        XXH64_update(state_, data, size);
        bytes_ += size;
        for (std::size_t i = 0; i < size; ++i) {
            if (data[i] == '\n') {
                ++newlines_;
            }
        }
        if (size > 0) {
            last_ = data[size - 1];
        }
    }

    [[nodiscard]] std::uint64_t digest() const { return XXH64_digest(state_); }
    [[nodiscard]] std::uint64_t bytes() const noexcept { return bytes_; }

    /// @brief Lines seen so far, counting an unterminated final line.
    [[nodiscard]] std::uint64_t lines() const noexcept {
        return newlines_ + ((bytes_ > 0 && last_ != '\n') ? 1 : 0);
    }

private:
    XXH64_state_t* state_;
    std::uint64_t bytes_ = 0;
    std::uint64_t newlines_ = 0;
    char last_ = '\n';
};

VoidResult hashFile(const std::filesystem::path& path, Xxh64Stream& stream) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return makeVoidError(ErrorCode::kArtifactExpired,
                             "file no longer exists: " + path.string());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return makeVoidError(ErrorCode::kSourceUnreadable, "cannot open: " + path.string());
    }

    std::vector<char> buffer(kPartitionReadChunkBytes);
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (input.bad()) {
            return makeVoidError(ErrorCode::kSourceUnreadable, "read failed: " + path.string());
        }
        stream.update(buffer.data(), static_cast<std::size_t>(input.gcount()));
    }
    return makeVoidSuccess();
}

}  // namespace

Result<VerificationReport> verifyPartitions(const Artifact& artifact,
                                            const std::vector<Partition>& partitions) {
    VerificationReport report;
    report.partitionCount = partitions.size();
    report.passThrough = partitions.size() == 1 && partitions.front().path == artifact.path;

    Xxh64Stream source;
    if (!source.valid()) {
        return makeError<VerificationReport>(ErrorCode::kIOError,
                                             "cannot allocate checksum state");
    }
    if (auto hashed = hashFile(artifact.path, source); !hashed) {
        return makeError<VerificationReport>(hashed.error());
    }
    report.artifactDigest = source.digest();
    report.artifactBytes = source.bytes();
    report.artifactLines = source.lines();

    if (report.passThrough) {
        report.partitionsDigest = report.artifactDigest;
        report.partitionBytes = report.artifactBytes;
        report.partitionLines = report.artifactLines;
        return report;
    }

    Xxh64Stream joined;
    if (!joined.valid()) {
        return makeError<VerificationReport>(ErrorCode::kIOError,
                                             "cannot allocate checksum state");
    }
    for (std::size_t i = 0; i < partitions.size(); ++i) {
        const auto& part = partitions[i];
        if (part.sequenceIndex != i + 1) {
            return makeError<VerificationReport>(
                ErrorCode::kVerificationFailed,
                fmt::format("partition {} is out of sequence (expected index {})", part.name,
                            i + 1));
        }
        if (auto hashed = hashFile(part.path, joined); !hashed) {
            return makeError<VerificationReport>(hashed.error());
        }
    }
    report.partitionsDigest = joined.digest();
    report.partitionBytes = joined.bytes();
    report.partitionLines = joined.lines();

    if (report.partitionBytes != report.artifactBytes) {
        return makeError<VerificationReport>(
            ErrorCode::kVerificationFailed,
            fmt::format("{}: partitions hold {} bytes, artifact holds {}", artifact.name,
                        report.partitionBytes, report.artifactBytes));
    }
    if (report.partitionLines != report.artifactLines) {
        return makeError<VerificationReport>(
            ErrorCode::kVerificationFailed,
            fmt::format("{}: partitions hold {} lines, artifact holds {}", artifact.name,
                        report.partitionLines, report.artifactLines));
    }
    if (report.partitionsDigest != report.artifactDigest) {
        return makeError<VerificationReport>(
            ErrorCode::kVerificationFailed,
            fmt::format("{}: checksum mismatch (expected {:016x}, got {:016x})", artifact.name,
                        report.artifactDigest, report.partitionsDigest));
    }

    NUMGEN_LOG_DEBUG("Verified {} partition(s) of {} (xxh64 {:016x})", partitions.size(),
                     artifact.name, report.artifactDigest);
    return report;
}

}  // namespace numgen::artifact
