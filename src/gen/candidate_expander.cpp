// =============================================================================
// numgen - Candidate Expander Implementation
// =============================================================================

#include "numgen/gen/candidate_expander.h"

#include <fmt/format.h>

namespace numgen::gen {

Result<CandidateExpander> CandidateExpander::create(const SegmentRecord& segment,
                                                    const std::optional<std::string>& exact4,
                                                    const std::optional<std::string>& exact3) {
    if (!isDigitString(segment.prefix, kPrefixDigits)) {
        return makeError<CandidateExpander>(
            ErrorCode::kInvalidArgument,
            fmt::format("segment prefix must be {} digits, got '{}'", kPrefixDigits, segment.prefix));
    }
    if (!isDigitString(segment.suffix, kRegionCodeDigits)) {
        return makeError<CandidateExpander>(
            ErrorCode::kInvalidArgument,
            fmt::format("segment suffix must be {} digits, got '{}'", kRegionCodeDigits,
                        segment.suffix));
    }

    const IdentifierKey blockKey = *parseDigits(segment.prefix + segment.suffix);
    const ExpansionMode mode = selectExpansionMode(exact4.has_value(), exact3.has_value());

    IdentifierKey fixedLocal = 0;
    if (mode == ExpansionMode::kExact4) {
        if (!isDigitString(*exact4, kLocalBlockDigits)) {
            return makeError<CandidateExpander>(
                ErrorCode::kInvalidArgument,
                fmt::format("exact suffix must be {} digits, got '{}'", kLocalBlockDigits, *exact4));
        }
        fixedLocal = *parseDigits(*exact4);
    } else if (mode == ExpansionMode::kExact3) {
        if (!isDigitString(*exact3, kLocalBlockDigits - 1)) {
            return makeError<CandidateExpander>(
                ErrorCode::kInvalidArgument,
                fmt::format("exact suffix must be {} digits, got '{}'", kLocalBlockDigits - 1,
                            *exact3));
        }
        fixedLocal = *parseDigits(*exact3);
    }

    return CandidateExpander(mode, blockKey, fixedLocal);
}

void CandidateExpander::expandInto(IdentifierKey* out) const noexcept {
    const std::size_t count = size();
    for (std::size_t i = 0; i < count; ++i) {
        out[i] = keyAt(i);
    }
}

std::vector<Identifier> CandidateExpander::materialize() const {
    std::vector<Identifier> identifiers;
    identifiers.reserve(size());
    for (Identifier id : *this) {
        identifiers.push_back(std::move(id));
    }
    return identifiers;
}

}  // namespace numgen::gen
