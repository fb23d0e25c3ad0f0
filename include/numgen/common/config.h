// =============================================================================
// numgen - Engine Configuration
// =============================================================================
// Explicit configuration passed into the engine's entry points.
//
// Values come from (highest precedence first) the command line, NUMGEN_*
// environment variables, the optional config file and the defaults below.
// Keeping limits in a value type lets several sessions run concurrently with
// different limits.
// =============================================================================

#ifndef NUMGEN_COMMON_CONFIG_H
#define NUMGEN_COMMON_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "numgen/common/error.h"
#include "numgen/common/size_format.h"
#include "numgen/common/types.h"

namespace numgen {

/// @brief Default artifact store directory.
inline constexpr const char* kDefaultStoreDir = "downloads";

/// @brief Default segment database path.
inline constexpr const char* kDefaultDatabasePath = "data/phone_location.db";

/// @brief Default log file path.
inline constexpr const char* kDefaultLogFile = "logs/numgen.log";

/// @brief Default route prepended to artifact names in result descriptors.
inline constexpr const char* kDefaultDownloadRoute = "/download";

/// @brief Default interval between scheduled retention sweeps (minutes).
inline constexpr std::uint64_t kDefaultSweepIntervalMinutes = 60;

struct Config {
    /// @brief Maximum number of identifiers a single request may produce.
    std::uint64_t maxCount = kDefaultMaxCount;

    /// @brief Artifacts larger than this are split into partitions (MB).
    std::uint64_t partitionSizeLimitMB = kDefaultPartitionSizeLimitMB;

    /// @brief Soft line ceiling per partition.
    std::size_t partitionLineCeiling = kDefaultPartitionLineCeiling;

    /// @brief Artifacts older than this are removed by retention (hours).
    std::uint64_t artifactExpiryHours = kDefaultArtifactExpiryHours;

    /// @brief Interval between scheduled retention sweeps (minutes).
    std::uint64_t sweepIntervalMinutes = kDefaultSweepIntervalMinutes;

    /// @brief Directory holding artifacts and partitions.
    std::filesystem::path storeDir = kDefaultStoreDir;

    /// @brief SQLite database holding the segment table.
    std::filesystem::path databasePath = kDefaultDatabasePath;

    /// @brief Route prefix for relative download paths.
    std::string downloadRoute = kDefaultDownloadRoute;

    /// @brief Worker threads for expansion (0 = automatic).
    std::size_t threads = 0;

    /// @brief Check partitions against their source after splitting.
    bool verifyPartitions = true;

    /// @brief Partition byte budget.
    [[nodiscard]] std::uint64_t partitionSizeLimitBytes() const noexcept {
        return partitionSizeLimitMB * kBytesPerMB;
    }

    /// @brief Retention age in seconds.
    [[nodiscard]] std::uint64_t artifactExpirySeconds() const noexcept {
        return artifactExpiryHours * 3600;
    }

    /// @brief Validate the configuration.
    /// @return VoidResult with kUsageError naming the first invalid value.
    [[nodiscard]] VoidResult validate() const;
};

}  // namespace numgen

#endif  // NUMGEN_COMMON_CONFIG_H
