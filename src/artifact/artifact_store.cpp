// =============================================================================
// numgen - Artifact Store Implementation
// =============================================================================

#include "numgen/artifact/artifact_store.h"

#include <ctime>
#include <fstream>
#include <mutex>
#include <set>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "numgen/artifact/artifact_partitioner.h"
#include "numgen/artifact/artifact_writer.h"
#include "numgen/common/logger.h"

namespace numgen::artifact {

namespace {

/// @brief Guards gReservedNames.
std::mutex gReservationMutex;

/// @brief Full paths of names handed out and not yet released.
std::set<std::string> gReservedNames;

/// @brief True for a single path component that stays inside the store.
bool isPlainFileName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find_first_of("/\\") == std::string_view::npos;
}

}  // namespace

std::string sanitizeNameComponent(std::string_view component) {
    std::string result(component);
    for (char& c : result) {
        if (c == '/' || c == '\\') {
            c = '_';
        }
    }
    return result;
}

std::string makeArtifactName(const FilterSpec& filter, std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&seconds, &local);

    char stamp[32];
    const std::size_t length = std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    return fmt::format("{}_{}_{}_{}_{}{}", filter.prefix, sanitizeNameComponent(filter.province),
                       sanitizeNameComponent(filter.city), filter.suffixToken(),
                       std::string_view(stamp, length), kArtifactExtension);
}

ArtifactStore::ArtifactStore(std::filesystem::path root) : root_(std::move(root)) {}

VoidResult ArtifactStore::ensureExists() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return makeVoidError(ErrorCode::kDestinationUnwritable,
                             IOError::formatWithSystemError(
                                 "cannot create store directory: " + root_.string(), ec));
    }
    return makeVoidSuccess();
}

std::string ArtifactStore::reserveName(const std::string& baseName) {
    std::lock_guard<std::mutex> lock(gReservationMutex);

    for (std::uint32_t n = 1;; ++n) {
        std::string candidate = disambiguateName(baseName, n);
        std::string key = (root_ / candidate).lexically_normal().string();
        std::error_code ec;
        if (gReservedNames.contains(key) || std::filesystem::exists(root_ / candidate, ec)) {
            continue;
        }
        gReservedNames.insert(std::move(key));
        if (n > 1) {
            NUMGEN_LOG_DEBUG("Name {} taken, using {}", baseName, candidate);
        }
        return candidate;
    }
}

void ArtifactStore::releaseName(const std::string& name) {
    std::lock_guard<std::mutex> lock(gReservationMutex);
    gReservedNames.erase((root_ / name).lexically_normal().string());
}

Result<std::filesystem::path> ArtifactStore::resolve(std::string_view name) const {
    if (!isPlainFileName(name)) {
        return makeError<std::filesystem::path>(ErrorCode::kInvalidArgument,
                                                fmt::format("invalid artifact name: '{}'", name));
    }
    std::filesystem::path path = root_ / std::string(name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return makeError<std::filesystem::path>(
            ErrorCode::kArtifactExpired,
            fmt::format("'{}' has expired or was never generated", name));
    }
    return path;
}

Result<Artifact> ArtifactStore::load(std::string_view name) const {
    auto path = resolve(name);
    if (!path) {
        return makeError<Artifact>(path.error());
    }

    std::ifstream stream(*path, std::ios::binary);
    if (!stream.is_open()) {
        return makeError<Artifact>(ErrorCode::kSourceUnreadable,
                                   "cannot open artifact: " + path->string());
    }

    Artifact artifact;
    artifact.name = std::string(name);
    artifact.path = *path;

    std::vector<char> chunk(kPartitionReadChunkBytes);
    char last = '\n';
    while (stream) {
        stream.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(stream.gcount());
        if (stream.bad()) {
            return makeError<Artifact>(ErrorCode::kSourceUnreadable,
                                       "read failed on artifact: " + path->string());
        }
        for (std::size_t i = 0; i < got; ++i) {
            if (chunk[i] == '\n') {
                ++artifact.lineCount;
            }
        }
        if (got > 0) {
            last = chunk[got - 1];
            artifact.sizeBytes += got;
        }
    }
    if (last != '\n') {
        ++artifact.lineCount;
    }
    return artifact;
}

Result<std::vector<Partition>> ArtifactStore::findPartitions(std::string_view artifactName) const {
    using PartitionList = std::vector<Partition>;
    if (!isPlainFileName(artifactName)) {
        return makeError<PartitionList>(
            ErrorCode::kInvalidArgument,
            fmt::format("invalid artifact name: '{}'", artifactName));
    }

    PartitionList partitions;
    for (std::uint32_t n = 1;; ++n) {
        Partition part;
        part.sequenceIndex = n;
        part.name = makePartitionName(n, artifactName);
        part.path = root_ / part.name;

        std::error_code ec;
        if (!std::filesystem::is_regular_file(part.path, ec)) {
            break;
        }
        auto loaded = load(part.name);
        if (!loaded) {
            return makeError<PartitionList>(loaded.error());
        }
        part.sizeBytes = loaded->sizeBytes;
        part.lineCount = loaded->lineCount;
        partitions.push_back(std::move(part));
    }
    return partitions;
}

std::uint64_t ArtifactStore::removePartitions(const std::vector<Partition>& partitions) const {
    std::uint64_t removed = 0;
    for (const auto& part : partitions) {
        std::error_code ec;
        if (std::filesystem::remove(part.path, ec)) {
            ++removed;
        } else if (ec) {
            NUMGEN_LOG_WARNING("Failed to remove partition {}: {}", part.path.string(),
                               ec.message());
        }
    }
    return removed;
}

std::string ArtifactStore::downloadPath(std::string_view route, std::string_view name) {
    if (!route.empty() && route.back() == '/') {
        route.remove_suffix(1);
    }
    return fmt::format("{}/{}", route, name);
}

}  // namespace numgen::artifact
