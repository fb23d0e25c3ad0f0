// =============================================================================
// numgen - Identifier Set Implementation
// =============================================================================

#include "numgen/gen/identifier_set.h"

#include <algorithm>

#include <tbb/parallel_sort.h>

namespace numgen::gen {

IdentifierSet IdentifierSet::freeze(std::vector<IdentifierKey> keys) {
    // Sessions hand over runs that are already ascending; skip the sort then.
    if (!std::is_sorted(keys.begin(), keys.end())) {
        tbb::parallel_sort(keys.begin(), keys.end());
    }
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    keys.shrink_to_fit();
    return IdentifierSet(std::move(keys));
}

bool IdentifierSet::contains(IdentifierKey key) const noexcept {
    return std::binary_search(keys_.begin(), keys_.end(), key);
}

bool IdentifierSet::contains(std::string_view identifier) const noexcept {
    if (identifier.size() != kIdentifierLength) {
        return false;
    }
    const auto key = parseDigits(identifier);
    return key.has_value() && contains(*key);
}

}  // namespace numgen::gen
