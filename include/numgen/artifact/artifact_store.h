// =============================================================================
// numgen - Artifact Store
// =============================================================================
// The directory holding artifacts and their partitions.
//
// Responsibilities:
// - Deterministic artifact naming:
//   {prefix}_{province}_{city}_{suffixToken}_{YYYYMMDD_HHMMSS}.txt
// - Process-wide name reservation so concurrent requests within the same
//   second never share a file name (a _2, _3, ... disambiguator is inserted
//   before the extension); the writer's no-replace publish covers other
//   processes sharing the store
// - Resolving names back to paths, reporting removed files as kArtifactExpired
// - Rediscovering the partitions of an artifact by name
// =============================================================================

#ifndef NUMGEN_ARTIFACT_ARTIFACT_STORE_H
#define NUMGEN_ARTIFACT_ARTIFACT_STORE_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::artifact {

/// @brief Build the base artifact name for a filter at a point in time.
/// @param filter Validated filter.
/// @param when Generation time, rendered in local time.
/// @note Path separators in province and city are replaced with '_'.
[[nodiscard]] std::string makeArtifactName(const FilterSpec& filter,
                                           std::chrono::system_clock::time_point when);

/// @brief Replace characters that would escape the store directory.
[[nodiscard]] std::string sanitizeNameComponent(std::string_view component);

class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root);

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /// @brief Create the store directory if it is missing.
    [[nodiscard]] VoidResult ensureExists() const;

    /// @brief Reserve a collision-free artifact name.
    /// @param baseName Name from makeArtifactName().
    /// @return baseName, or baseName with a _N disambiguator before the extension
    ///         if it exists on disk or is held by another reservation.
    [[nodiscard]] std::string reserveName(const std::string& baseName);

    /// @brief Release a reservation once the artifact exists on disk or was abandoned.
    void releaseName(const std::string& name);

    /// @brief Resolve a stored file name to its path.
    /// @return The path, kInvalidArgument for names that are not plain file
    ///         names, or kArtifactExpired if the file is gone.
    [[nodiscard]] Result<std::filesystem::path> resolve(std::string_view name) const;

    /// @brief Load an artifact descriptor for a stored file.
    /// @note The line count is taken as the number of '\n' terminated lines
    ///       plus a trailing unterminated one.
    [[nodiscard]] Result<Artifact> load(std::string_view name) const;

    /// @brief Find the partitions of an artifact (part_1_..., part_2_..., contiguous).
    [[nodiscard]] Result<std::vector<Partition>> findPartitions(std::string_view artifactName) const;

    /// @brief Delete partition files; missing files are ignored.
    /// @return Number of files removed.
    std::uint64_t removePartitions(const std::vector<Partition>& partitions) const;

    /// @brief Relative download path of a stored file.
    [[nodiscard]] static std::string downloadPath(std::string_view route, std::string_view name);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace numgen::artifact

#endif  // NUMGEN_ARTIFACT_ARTIFACT_STORE_H
