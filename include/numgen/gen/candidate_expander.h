// =============================================================================
// numgen - Candidate Expander
// =============================================================================
// Expands one matched segment into the identifiers a filter implies.
//
// Expansion modes:
// - kExact4: one identifier, prefix + suffix + exact4
// - kExact3: ten identifiers, prefix + suffix + d + exact3 for d = 0..9
// - kFull:   10,000 identifiers, prefix + suffix + 0000..9999
//
// Every mode yields its identifiers in ascending order. The expander is a
// pure, restartable lazy sequence: it holds only the block key and the
// mode, supports random access by index, and can be iterated any number of
// times or materialized.
// =============================================================================

#ifndef NUMGEN_GEN_CANDIDATE_EXPANDER_H
#define NUMGEN_GEN_CANDIDATE_EXPANDER_H

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::gen {

// =============================================================================
// Expansion Mode
// =============================================================================

enum class ExpansionMode : std::uint8_t {
    /// @brief All four local digits fixed.
    kExact4 = 0,

    /// @brief Last three local digits fixed, first one free.
    kExact3 = 1,

    /// @brief Local block fully enumerated.
    kFull = 2
};

[[nodiscard]] constexpr std::string_view expansionModeToString(ExpansionMode mode) noexcept {
    switch (mode) {
        case ExpansionMode::kExact4:
            return "exact4";
        case ExpansionMode::kExact3:
            return "exact3";
        case ExpansionMode::kFull:
            return "full";
    }
    return "unknown";
}

/// @brief Select the expansion mode for a pair of optional exact suffixes.
[[nodiscard]] constexpr ExpansionMode selectExpansionMode(bool hasExact4, bool hasExact3) noexcept {
    if (hasExact4) {
        return ExpansionMode::kExact4;
    }
    if (hasExact3) {
        return ExpansionMode::kExact3;
    }
    return ExpansionMode::kFull;
}

/// @brief Number of identifiers one segment expands to in @p mode.
[[nodiscard]] constexpr std::size_t expansionCardinality(ExpansionMode mode) noexcept {
    switch (mode) {
        case ExpansionMode::kExact4:
            return 1;
        case ExpansionMode::kExact3:
            return kExact3Cardinality;
        case ExpansionMode::kFull:
            return kLocalBlockCardinality;
    }
    return 0;
}

// =============================================================================
// CandidateExpander Class
// =============================================================================

class CandidateExpander {
public:
    /// @brief Forward iterator yielding identifier strings in ascending order.
    class Iterator {
    public:
        using iterator_concept = std::forward_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = Identifier;
        using difference_type = std::ptrdiff_t;
        using reference = Identifier;

        Iterator() = default;
        Iterator(const CandidateExpander* owner, std::size_t index) noexcept
            : owner_(owner), index_(index) {}

        [[nodiscard]] Identifier operator*() const { return owner_->at(index_); }

        Iterator& operator++() noexcept {
            ++index_;
            return *this;
        }

        Iterator operator++(int) noexcept {
            Iterator copy = *this;
            ++index_;
            return copy;
        }

        [[nodiscard]] bool operator==(const Iterator& other) const noexcept {
            return index_ == other.index_;
        }

    private:
        const CandidateExpander* owner_ = nullptr;
        std::size_t index_ = 0;
    };

    /// @brief Create an expander for one segment.
    /// @param segment The matched segment (3-digit prefix, 4-digit suffix).
    /// @param exact4 Exact trailing 4 digits, if requested.
    /// @param exact3 Exact trailing 3 digits, if requested (ignored when exact4 is set).
    /// @return The expander, or kInvalidArgument if a field has the wrong width.
    [[nodiscard]] static Result<CandidateExpander> create(const SegmentRecord& segment,
                                                         const std::optional<std::string>& exact4,
                                                         const std::optional<std::string>& exact3);

    [[nodiscard]] ExpansionMode mode() const noexcept { return mode_; }

    /// @brief Number of identifiers in the sequence.
    [[nodiscard]] std::size_t size() const noexcept { return expansionCardinality(mode_); }

    /// @brief Numeric value of prefix + suffix (7 digits).
    [[nodiscard]] IdentifierKey blockKey() const noexcept { return blockKey_; }

    /// @brief Key of the @p index-th identifier (0 <= index < size()).
    [[nodiscard]] IdentifierKey keyAt(std::size_t index) const noexcept {
        const IdentifierKey base = blockKey_ * kLocalBlockCardinality;
        switch (mode_) {
            case ExpansionMode::kExact4:
                return base + fixedLocal_;
            case ExpansionMode::kExact3:
                return base + static_cast<IdentifierKey>(index) * 1000 + fixedLocal_;
            case ExpansionMode::kFull:
                break;
        }
        return base + static_cast<IdentifierKey>(index);
    }

    /// @brief The @p index-th identifier string.
    [[nodiscard]] Identifier at(std::size_t index) const { return formatIdentifier(keyAt(index)); }

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(this, 0); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(this, size()); }

    /// @brief Write every key into @p out, which must hold size() entries.
    void expandInto(IdentifierKey* out) const noexcept;

    /// @brief Materialize the sequence as identifier strings.
    [[nodiscard]] std::vector<Identifier> materialize() const;

private:
    CandidateExpander(ExpansionMode mode, IdentifierKey blockKey, IdentifierKey fixedLocal) noexcept
        : mode_(mode), blockKey_(blockKey), fixedLocal_(fixedLocal) {}

    ExpansionMode mode_;
    IdentifierKey blockKey_;

    /// @brief Fixed local digits (exact4 value, or exact3 value), unused for kFull.
    IdentifierKey fixedLocal_;
};

/// @brief Expand one segment; see CandidateExpander::create.
[[nodiscard]] inline Result<CandidateExpander> expand(const SegmentRecord& segment,
                                                     const std::optional<std::string>& exact4,
                                                     const std::optional<std::string>& exact3) {
    return CandidateExpander::create(segment, exact4, exact3);
}

}  // namespace numgen::gen

#endif  // NUMGEN_GEN_CANDIDATE_EXPANDER_H
