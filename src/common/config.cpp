// =============================================================================
// numgen - Engine Configuration Implementation
// =============================================================================

#include "numgen/common/config.h"

#include <cstdint>
#include <limits>

#include <fmt/format.h>

namespace numgen {

namespace {

/// @brief Largest MB value whose byte count fits in 64 bits.
constexpr std::uint64_t kMaxPartitionSizeMB = std::numeric_limits<std::uint64_t>::max() / kBytesPerMB;

/// @brief Largest identifier set that fits the 11-digit key space.
constexpr std::uint64_t kMaxRepresentableCount = 100'000'000'000ULL;

/// @brief Largest number of nanoseconds a signed 64-bit clock duration holds.
constexpr std::uint64_t kMaxClockNanoseconds =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

/// @brief Largest expiry whose span fits the file clock's nanosecond ticks.
constexpr std::uint64_t kMaxArtifactExpiryHours = kMaxClockNanoseconds / (3600ULL * 1'000'000'000ULL);

/// @brief Largest sweep interval a scheduler deadline can be computed for.
constexpr std::uint64_t kMaxSweepIntervalMinutes = kMaxClockNanoseconds / (2ULL * 60ULL * 1'000'000'000ULL);

}  // namespace

VoidResult Config::validate() const {
    if (maxCount == 0) {
        return makeVoidError(ErrorCode::kUsageError, "maxCount must be greater than 0");
    }
    if (maxCount > kMaxRepresentableCount) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("maxCount must not exceed {}", kMaxRepresentableCount));
    }
    if (partitionSizeLimitMB == 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "filePartitionSizeLimitMB must be greater than 0");
    }
    if (partitionSizeLimitMB > kMaxPartitionSizeMB) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("filePartitionSizeLimitMB must not exceed {}",
                                         kMaxPartitionSizeMB));
    }
    if (partitionLineCeiling == 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "partition line ceiling must be greater than 0");
    }
    if (artifactExpiryHours == 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "artifactExpiryHours must be greater than 0");
    }
    if (artifactExpiryHours > kMaxArtifactExpiryHours) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("artifactExpiryHours must not exceed {}",
                                         kMaxArtifactExpiryHours));
    }
    if (sweepIntervalMinutes == 0) {
        return makeVoidError(ErrorCode::kUsageError,
                             "sweep interval must be greater than 0");
    }
    if (sweepIntervalMinutes > kMaxSweepIntervalMinutes) {
        return makeVoidError(ErrorCode::kUsageError,
                             fmt::format("sweep interval must not exceed {} minutes",
                                         kMaxSweepIntervalMinutes));
    }
    if (storeDir.empty()) {
        return makeVoidError(ErrorCode::kUsageError, "store directory must not be empty");
    }
    return makeVoidSuccess();
}

}  // namespace numgen
