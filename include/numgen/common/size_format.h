// =============================================================================
// numgen - Size Formatting
// =============================================================================
// Human-readable rendering of byte counts for result descriptors and logs.
// =============================================================================

#ifndef NUMGEN_COMMON_SIZE_FORMAT_H
#define NUMGEN_COMMON_SIZE_FORMAT_H

#include <cstdint>
#include <string>

namespace numgen {

/// @brief Bytes per mebibyte, used for all MB-denominated limits.
inline constexpr std::uint64_t kBytesPerMB = 1024ULL * 1024ULL;

/// @brief Format a byte count with two decimals in B, KB, MB, GB or TB.
/// @note Divides by 1024 until the value drops below 1024 or TB is reached:
///       formatFileSize(500) == "500.00 B", formatFileSize(2048) == "2.00 KB".
[[nodiscard]] std::string formatFileSize(std::uint64_t bytes);

}  // namespace numgen

#endif  // NUMGEN_COMMON_SIZE_FORMAT_H
