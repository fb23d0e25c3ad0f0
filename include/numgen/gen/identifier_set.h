// =============================================================================
// numgen - Identifier Set
// =============================================================================
// Frozen, deduplicated, ascending set of identifiers.
//
// Identifiers are held as 64-bit keys (8 bytes each instead of a string per
// entry) so a set at the default ceiling of 10,000,000 stays around 80 MB.
// Because every identifier has the same width, ascending key order is the
// ascending lexicographic order of the identifier strings.
// =============================================================================

#ifndef NUMGEN_GEN_IDENTIFIER_SET_H
#define NUMGEN_GEN_IDENTIFIER_SET_H

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include "numgen/common/types.h"

namespace numgen::gen {

class IdentifierSet {
public:
    using const_iterator = std::vector<IdentifierKey>::const_iterator;

    /// @brief Construct an empty set.
    IdentifierSet() = default;

    /// @brief Freeze a collection of keys into a set.
    /// @param keys Keys in any order, possibly with duplicates.
    /// @return Set holding each key once, ascending.
    [[nodiscard]] static IdentifierSet freeze(std::vector<IdentifierKey> keys);

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }
    [[nodiscard]] bool empty() const noexcept { return keys_.empty(); }

    /// @brief All keys, ascending.
    [[nodiscard]] std::span<const IdentifierKey> keys() const noexcept { return keys_; }

    [[nodiscard]] IdentifierKey keyAt(std::size_t index) const { return keys_[index]; }

    /// @brief The @p index-th identifier string.
    [[nodiscard]] Identifier at(std::size_t index) const { return formatIdentifier(keys_[index]); }

    [[nodiscard]] bool contains(IdentifierKey key) const noexcept;

    /// @brief Check membership of an identifier string.
    [[nodiscard]] bool contains(std::string_view identifier) const noexcept;

    [[nodiscard]] const_iterator begin() const noexcept { return keys_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return keys_.end(); }

private:
    explicit IdentifierSet(std::vector<IdentifierKey> keys) noexcept : keys_(std::move(keys)) {}

    std::vector<IdentifierKey> keys_;
};

}  // namespace numgen::gen

#endif  // NUMGEN_GEN_IDENTIFIER_SET_H
