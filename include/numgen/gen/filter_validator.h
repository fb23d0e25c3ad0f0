// =============================================================================
// numgen - Filter Validation
// =============================================================================
// Turns a raw, user-supplied filter into a validated FilterSpec.
//
// Validation happens before the generation core runs; the core assumes its
// inputs satisfy every rule checked here:
// - prefix: exactly 3 digits
// - province, city: non-empty
// - suffix4 / suffix3: blank means absent; mutually exclusive; 4 / 3 digits
// - operators: each in [1, 5]; duplicates collapse
// =============================================================================

#ifndef NUMGEN_GEN_FILTER_VALIDATOR_H
#define NUMGEN_GEN_FILTER_VALIDATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "numgen/common/error.h"
#include "numgen/common/types.h"

namespace numgen::gen {

/// @brief Filter fields as received from the caller, before validation.
struct RawFilter {
    std::string prefix;
    std::string suffix4;
    std::string suffix3;
    std::string province;
    std::string city;
    std::vector<int> operators;
};

/// @brief Validate a raw filter.
/// @param raw The raw filter.
/// @param maxCount Generation ceiling copied into the resulting spec.
/// @return The validated spec, or kInvalidFilter naming the offending field.
[[nodiscard]] Result<FilterSpec> validateFilter(const RawFilter& raw, std::uint64_t maxCount);

}  // namespace numgen::gen

#endif  // NUMGEN_GEN_FILTER_VALIDATOR_H
