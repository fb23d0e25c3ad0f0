// =============================================================================
// numgen - Artifact Partitioner Implementation
// =============================================================================

#include "numgen/artifact/artifact_partitioner.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "numgen/common/logger.h"

namespace numgen::artifact {

namespace {

/// @brief Accumulates the lines of the partition being built.
class PartitionBuffer {
public:
    PartitionBuffer(const Artifact& artifact, std::uint64_t maxBytes, std::size_t maxLines)
        : artifact_(artifact), maxBytes_(maxBytes), maxLines_(maxLines) {
        data_.reserve(static_cast<std::size_t>(maxBytes) + kArtifactLineBytes);
    }

    void append(const char* begin, std::size_t length) {
        data_.append(begin, length);
        partialBytes_ += length;
    }

    /// @brief Record that a complete line now ends the buffer.
    void completeLine() noexcept {
        ++lines_;
        partialBytes_ = 0;
    }

    /// @brief True while bytes of an unterminated line are buffered.
    [[nodiscard]] bool hasPartialLine() const noexcept { return partialBytes_ > 0; }

    [[nodiscard]] bool full() const noexcept {
        return data_.size() >= maxBytes_ || lines_ >= maxLines_;
    }

    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    /// @brief Write the buffered lines as the next partition and reset.
    VoidResult flush(std::vector<Partition>& out) {
        Partition part;
        part.sequenceIndex = static_cast<std::uint32_t>(out.size() + 1);
        part.name = makePartitionName(part.sequenceIndex, artifact_.name);
        part.path = artifact_.path.parent_path() / part.name;
        part.lineCount = lines_;
        part.sizeBytes = data_.size();

        // An existing file under the partition name belongs to someone else
        std::ofstream stream(part.path, std::ios::binary | std::ios::out | std::ios::noreplace);
        if (!stream.is_open()) {
            return makeVoidError(ErrorCode::kDestinationUnwritable,
                                 "cannot create partition file: " + part.path.string());
        }
        out.push_back(part);
        stream.write(data_.data(), static_cast<std::streamsize>(data_.size()));
        stream.flush();
        if (!stream) {
            return makeVoidError(ErrorCode::kDiskExhausted,
                                 "write failed for partition: " + part.path.string());
        }
        stream.close();
        if (stream.fail()) {
            return makeVoidError(ErrorCode::kDiskExhausted,
                                 "close failed for partition: " + part.path.string());
        }

        NUMGEN_LOG_DEBUG("Partition {} written ({} lines, {} bytes)", part.name, part.lineCount,
                         part.sizeBytes);
        data_.clear();
        lines_ = 0;
        return makeVoidSuccess();
    }

private:
    const Artifact& artifact_;
    std::uint64_t maxBytes_;
    std::size_t maxLines_;
    std::string data_;
    std::size_t lines_ = 0;
    std::size_t partialBytes_ = 0;
};

/// @brief Deletes the partition files created so far unless released.
class PartialOutputGuard {
public:
    explicit PartialOutputGuard(const std::vector<Partition>& partitions)
        : partitions_(partitions) {}

    ~PartialOutputGuard() {
        if (released_) {
            return;
        }
        for (const auto& part : partitions_) {
            std::error_code ec;
            if (!std::filesystem::remove(part.path, ec) && ec) {
                NUMGEN_LOG_WARNING("Failed to remove partial partition {}: {}",
                                   part.path.string(), ec.message());
            }
        }
        if (!partitions_.empty()) {
            NUMGEN_LOG_DEBUG("Removed {} partial partition(s)", partitions_.size());
        }
    }

    PartialOutputGuard(const PartialOutputGuard&) = delete;
    PartialOutputGuard& operator=(const PartialOutputGuard&) = delete;

    void release() noexcept { released_ = true; }

private:
    const std::vector<Partition>& partitions_;
    bool released_ = false;
};

}  // namespace

std::string makePartitionName(std::uint32_t sequenceIndex, std::string_view artifactName) {
    return fmt::format("{}{}_{}", kPartitionNamePrefix, sequenceIndex, artifactName);
}

ArtifactPartitioner::ArtifactPartitioner(std::size_t lineCeiling) : lineCeiling_(lineCeiling) {}

Result<std::vector<Partition>> ArtifactPartitioner::partition(const Artifact& artifact,
                                                              std::uint64_t maxPartBytes) const {
    using PartitionList = std::vector<Partition>;

    if (maxPartBytes == 0) {
        return makeError<PartitionList>(ErrorCode::kInvalidArgument,
                                        "partition byte budget must be greater than zero");
    }
    if (lineCeiling_ == 0) {
        return makeError<PartitionList>(ErrorCode::kInvalidArgument,
                                        "partition line ceiling must be greater than zero");
    }

    std::error_code ec;
    if (!std::filesystem::exists(artifact.path, ec)) {
        return makeError<PartitionList>(ErrorCode::kArtifactExpired,
                                        "artifact no longer exists: " + artifact.path.string());
    }

    if (artifact.sizeBytes == 0) {
        return PartitionList{};
    }

    if (artifact.sizeBytes <= maxPartBytes) {
        Partition whole;
        whole.name = artifact.name;
        whole.path = artifact.path;
        whole.sizeBytes = artifact.sizeBytes;
        whole.lineCount = artifact.lineCount;
        whole.sequenceIndex = 1;
        return PartitionList{std::move(whole)};
    }

    std::ifstream source(artifact.path, std::ios::binary);
    if (!source.is_open()) {
        return makeError<PartitionList>(ErrorCode::kSourceUnreadable,
                                        "cannot open artifact: " + artifact.path.string());
    }

    PartitionList partitions;
    PartialOutputGuard cleanup(partitions);
    PartitionBuffer buffer(artifact, maxPartBytes, lineCeiling_);
    std::vector<char> chunk(kPartitionReadChunkBytes);

    while (true) {
        source.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(source.gcount());
        if (source.bad()) {
            return makeError<PartitionList>(ErrorCode::kSourceUnreadable,
                                            "read failed on artifact: " + artifact.path.string());
        }
        if (got == 0) {
            break;
        }

        std::size_t lineStart = 0;
        for (std::size_t i = 0; i < got; ++i) {
            if (chunk[i] != '\n') {
                continue;
            }
            buffer.append(chunk.data() + lineStart, i + 1 - lineStart);
            buffer.completeLine();
            lineStart = i + 1;
            if (buffer.full()) {
                if (auto flushed = buffer.flush(partitions); !flushed) {
                    return makeError<PartitionList>(flushed.error());
                }
            }
        }
        // Carry the unterminated tail into the next chunk
        buffer.append(chunk.data() + lineStart, got - lineStart);

        if (source.eof()) {
            break;
        }
    }

    if (buffer.hasPartialLine()) {
        // Final line without a terminator
        buffer.completeLine();
    }
    if (!buffer.empty()) {
        if (auto flushed = buffer.flush(partitions); !flushed) {
            return makeError<PartitionList>(flushed.error());
        }
    }

    cleanup.release();
    NUMGEN_LOG_INFO("Split {} into {} partition(s)", artifact.name, partitions.size());
    return partitions;
}

}  // namespace numgen::artifact
