// =============================================================================
// numgen - Common Type Definitions
// =============================================================================
// Core type definitions for the numgen library.
//
// This module defines:
// - SegmentRecord: one (prefix, region code) block served by one operator
// - FilterSpec: a validated generation request
// - Artifact, Partition: files produced by the artifact module
// - IdentifierKey: numeric form of an 11-digit identifier
// - Width and default-limit constants
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef NUMGEN_COMMON_TYPES_H
#define NUMGEN_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace numgen {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Operator code of a segment (1-5).
using OperatorCode = std::uint8_t;

/// @brief Numeric value of an 11-digit identifier.
/// @note Ascending numeric order of keys equals ascending lexicographic order
///       of the zero-padded identifier strings.
using IdentifierKey = std::uint64_t;

/// @brief Textual identifier, always kIdentifierLength ASCII digits.
using Identifier = std::string;

// =============================================================================
// Constants
// =============================================================================

/// @brief Digits in the leading prefix block.
inline constexpr std::size_t kPrefixDigits = 3;

/// @brief Digits in the region code (segment suffix) block.
inline constexpr std::size_t kRegionCodeDigits = 4;

/// @brief Digits in the trailing local block.
inline constexpr std::size_t kLocalBlockDigits = 4;

/// @brief Total identifier length.
inline constexpr std::size_t kIdentifierLength =
    kPrefixDigits + kRegionCodeDigits + kLocalBlockDigits;

/// @brief Bytes per artifact line (identifier + '\n').
inline constexpr std::size_t kArtifactLineBytes = kIdentifierLength + 1;

/// @brief Number of distinct local blocks (0000-9999).
inline constexpr std::size_t kLocalBlockCardinality = 10'000;

/// @brief Identifiers produced per segment when only three local digits are fixed.
inline constexpr std::size_t kExact3Cardinality = 10;

/// @brief Valid operator codes.
inline constexpr OperatorCode kMinOperatorCode = 1;
inline constexpr OperatorCode kMaxOperatorCode = 5;

/// @brief Default generation ceiling.
inline constexpr std::uint64_t kDefaultMaxCount = 10'000'000;

/// @brief Default partition size limit (MB).
inline constexpr std::uint64_t kDefaultPartitionSizeLimitMB = 20;

/// @brief Default artifact expiry (hours).
inline constexpr std::uint64_t kDefaultArtifactExpiryHours = 24;

/// @brief Soft line-count ceiling per partition.
inline constexpr std::size_t kDefaultPartitionLineCeiling = 500'000;

/// @brief Token used in artifact names when no exact suffix was requested.
inline constexpr std::string_view kAllSuffixToken = "ALL";

/// @brief Artifact file extension.
inline constexpr std::string_view kArtifactExtension = ".txt";

/// @brief Prefix of partition file names.
inline constexpr std::string_view kPartitionNamePrefix = "part_";

// =============================================================================
// Segment Record
// =============================================================================

/// @brief One (prefix, region code) block served by one operator in one city.
/// @note Produced by the lookup collaborator; treated as immutable.
struct SegmentRecord {
    /// @brief Leading 3-digit block.
    std::string prefix;

    /// @brief Middle 4-digit block (region code).
    std::string suffix;

    std::string province;
    std::string city;

    /// @brief Operator code (1-5).
    OperatorCode operatorCode = 0;

    [[nodiscard]] bool operator==(const SegmentRecord&) const = default;
};

// =============================================================================
// Filter Specification
// =============================================================================

/// @brief Validated generation request.
/// @note exactSuffix4 and exactSuffix3 are never both set.
struct FilterSpec {
    /// @brief 3-digit prefix.
    std::string prefix;

    /// @brief Exact trailing 4 digits, if requested.
    std::optional<std::string> exactSuffix4;

    /// @brief Exact trailing 3 digits, if requested.
    std::optional<std::string> exactSuffix3;

    std::string province;
    std::string city;

    /// @brief Operator codes to match, sorted and unique. Empty matches any operator.
    std::vector<OperatorCode> operators;

    /// @brief Maximum number of identifiers this request may produce.
    std::uint64_t maxCount = kDefaultMaxCount;

    /// @brief Token used in artifact names: the exact suffix or "ALL".
    [[nodiscard]] std::string suffixToken() const {
        if (exactSuffix4.has_value()) {
            return *exactSuffix4;
        }
        if (exactSuffix3.has_value()) {
            return *exactSuffix3;
        }
        return std::string(kAllSuffixToken);
    }
};

// =============================================================================
// Artifact and Partition
// =============================================================================

/// @brief A persisted line-oriented file holding one identifier per line.
struct Artifact {
    std::string name;
    std::filesystem::path path;
    std::uint64_t sizeBytes = 0;
    std::uint64_t lineCount = 0;
};

/// @brief A line-aligned contiguous slice of an artifact, persisted as its own file.
struct Partition {
    std::string name;
    std::filesystem::path path;
    std::uint64_t sizeBytes = 0;
    std::uint64_t lineCount = 0;

    /// @brief 1-based position in the partition sequence.
    std::uint32_t sequenceIndex = 0;
};

// =============================================================================
// Identifier Encoding
// =============================================================================

/// @brief Write the zero-padded decimal form of a key into a fixed buffer.
/// @param key Identifier key (must be below 10^11).
/// @param out Destination for exactly kIdentifierLength characters.
inline void formatIdentifierInto(IdentifierKey key, char* out) noexcept {
    for (std::size_t i = kIdentifierLength; i > 0; --i) {
        out[i - 1] = static_cast<char>('0' + (key % 10));
        key /= 10;
    }
}

/// @brief Format a key as its 11-digit identifier string.
[[nodiscard]] inline Identifier formatIdentifier(IdentifierKey key) {
    std::array<char, kIdentifierLength> buffer{};
    formatIdentifierInto(key, buffer.data());
    return Identifier(buffer.data(), buffer.size());
}

/// @brief Parse a string of ASCII digits into its numeric value.
/// @return std::nullopt if the string is empty, too long or has a non-digit.
[[nodiscard]] inline std::optional<std::uint64_t> parseDigits(std::string_view digits) noexcept {
    if (digits.empty() || digits.size() > kIdentifierLength) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return value;
}

/// @brief Check that a string consists of exactly @p width ASCII digits.
[[nodiscard]] inline bool isDigitString(std::string_view str, std::size_t width) noexcept {
    return str.size() == width && parseDigits(str).has_value();
}

}  // namespace numgen

#endif  // NUMGEN_COMMON_TYPES_H
