// =============================================================================
// numgen - Artifact Writer Implementation
// =============================================================================

#include "numgen/artifact/artifact_writer.h"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "numgen/common/logger.h"

namespace numgen::artifact {

namespace {

/// @brief Removes the temporary file when the write scope ends.
class TempFileGuard {
public:
    TempFileGuard() = default;

    ~TempFileGuard() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove(path_, ec);
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void track(std::filesystem::path path) { path_ = std::move(path); }

private:
    std::filesystem::path path_;
};

/// @brief Create a temporary file that no other writer holds.
/// @return Path of the created file; kDestinationUnwritable when none can be created.
Result<std::filesystem::path> openExclusiveTemp(const std::filesystem::path& storeDir,
                                                std::string_view destinationName,
                                                std::ofstream& stream) {
    for (std::uint32_t attempt = 1; attempt <= kMaxNameAttempts; ++attempt) {
        const std::string base =
            attempt == 1 ? std::string(destinationName)
                         : fmt::format("{}.{}", destinationName, attempt);
        std::filesystem::path path = storeDir / (base + std::string(kTempSuffix));

        stream.open(path, std::ios::binary | std::ios::out | std::ios::noreplace);
        if (stream.is_open()) {
            return path;
        }
        stream.clear();

        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return makeError<std::filesystem::path>(
                ErrorCode::kDestinationUnwritable, "cannot create artifact file: " + path.string());
        }
    }
    return makeError<std::filesystem::path>(
        ErrorCode::kDestinationUnwritable,
        fmt::format("no free temporary name for {} after {} attempts", destinationName,
                    kMaxNameAttempts));
}

}  // namespace

std::string disambiguateName(std::string_view baseName, std::uint32_t attempt) {
    if (attempt <= 1) {
        return std::string(baseName);
    }
    const auto dot = baseName.rfind('.');
    if (dot == std::string_view::npos) {
        return fmt::format("{}_{}", baseName, attempt);
    }
    return fmt::format("{}_{}{}", baseName.substr(0, dot), attempt, baseName.substr(dot));
}

ArtifactWriter::ArtifactWriter(std::filesystem::path storeDir,
                               const CancellationToken* cancellation)
    : storeDir_(std::move(storeDir)), cancellation_(cancellation) {}

Result<Artifact> ArtifactWriter::write(const gen::IdentifierSet& identifiers,
                                       std::string_view destinationName) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(storeDir_, ec)) {
        return makeError<Artifact>(ErrorCode::kDestinationUnwritable,
                                   "store directory does not exist: " + storeDir_.string());
    }

    TempFileGuard guard;
    std::ofstream stream;
    auto temp = openExclusiveTemp(storeDir_, destinationName, stream);
    if (!temp) {
        return makeError<Artifact>(temp.error());
    }
    const std::filesystem::path tempPath = *temp;
    guard.track(tempPath);

    {
        const auto keys = identifiers.keys();
        std::vector<char> buffer(std::min(keys.size(), kWriteBatchLines) * kArtifactLineBytes);

        std::size_t offset = 0;
        while (offset < keys.size()) {
            if (isCancelled(cancellation_)) {
                return makeError<Artifact>(ErrorCode::kCancelled, "artifact write cancelled");
            }

            const std::size_t batch = std::min(keys.size() - offset, kWriteBatchLines);
            char* out = buffer.data();
            for (std::size_t i = 0; i < batch; ++i) {
                formatIdentifierInto(keys[offset + i], out);
                out[kIdentifierLength] = '\n';
                out += kArtifactLineBytes;
            }

            stream.write(buffer.data(), static_cast<std::streamsize>(batch * kArtifactLineBytes));
            if (!stream) {
                return makeError<Artifact>(ErrorCode::kDiskExhausted,
                                           "write failed after " + std::to_string(offset) +
                                               " lines: " + tempPath.string());
            }
            offset += batch;
        }

        stream.flush();
        if (!stream) {
            return makeError<Artifact>(ErrorCode::kDiskExhausted,
                                       "flush failed: " + tempPath.string());
        }
        stream.close();
        if (stream.fail()) {
            return makeError<Artifact>(ErrorCode::kDiskExhausted,
                                       "close failed: " + tempPath.string());
        }
    }

    // A hard link never replaces an existing entry, so a name another writer
    // published first is skipped instead of overwritten
    std::string publishedName;
    std::filesystem::path finalPath;
    for (std::uint32_t attempt = 1; attempt <= kMaxNameAttempts && publishedName.empty();
         ++attempt) {
        std::string candidate = disambiguateName(destinationName, attempt);
        std::filesystem::path candidatePath = storeDir_ / candidate;
        std::filesystem::create_hard_link(tempPath, candidatePath, ec);
        if (!ec) {
            publishedName = std::move(candidate);
            finalPath = std::move(candidatePath);
        } else if (ec != std::errc::file_exists) {
            return makeError<Artifact>(
                ErrorCode::kDestinationUnwritable,
                IOError::formatWithSystemError(
                    "cannot move artifact into place: " + candidatePath.string(), ec));
        }
    }
    if (publishedName.empty()) {
        return makeError<Artifact>(ErrorCode::kDestinationUnwritable,
                                   fmt::format("no free artifact name for {} after {} attempts",
                                               destinationName, kMaxNameAttempts));
    }
    if (publishedName != destinationName) {
        NUMGEN_LOG_DEBUG("Name {} already taken, published as {}", destinationName, publishedName);
    }

    Artifact artifact;
    artifact.name = std::move(publishedName);
    artifact.path = finalPath;
    artifact.lineCount = identifiers.size();
    artifact.sizeBytes = std::filesystem::file_size(finalPath, ec);
    if (ec) {
        return makeError<Artifact>(ErrorCode::kSourceUnreadable,
                                   IOError::formatWithSystemError(
                                       "cannot stat written artifact: " + finalPath.string(), ec));
    }

    NUMGEN_LOG_DEBUG("Artifact written: {} ({} lines, {} bytes)", artifact.path.string(),
                     artifact.lineCount, artifact.sizeBytes);
    return artifact;
}

}  // namespace numgen::artifact
