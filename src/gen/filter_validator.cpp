// =============================================================================
// numgen - Filter Validation Implementation
// =============================================================================

#include "numgen/gen/filter_validator.h"

#include <algorithm>
#include <cctype>
#include <string_view>

#include <fmt/format.h>

namespace numgen::gen {

namespace {

std::string trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return std::string(str);
}

Result<FilterSpec> invalid(std::string message) {
    return makeError<FilterSpec>(ErrorCode::kInvalidFilter, std::move(message));
}

}  // namespace

Result<FilterSpec> validateFilter(const RawFilter& raw, std::uint64_t maxCount) {
    FilterSpec spec;
    spec.maxCount = maxCount;

    spec.prefix = trim(raw.prefix);
    if (spec.prefix.empty()) {
        return invalid("prefix is required");
    }
    if (!isDigitString(spec.prefix, kPrefixDigits)) {
        return invalid(fmt::format("prefix must be exactly {} digits, got '{}'", kPrefixDigits,
                                   spec.prefix));
    }

    spec.province = trim(raw.province);
    if (spec.province.empty()) {
        return invalid("province is required");
    }

    spec.city = trim(raw.city);
    if (spec.city.empty()) {
        return invalid("city is required");
    }

    std::string suffix4 = trim(raw.suffix4);
    std::string suffix3 = trim(raw.suffix3);
    if (!suffix4.empty() && !suffix3.empty()) {
        return invalid("only one of suffix4 and suffix3 may be given");
    }
    if (!suffix4.empty()) {
        if (!isDigitString(suffix4, kLocalBlockDigits)) {
            return invalid(fmt::format("suffix4 must be exactly {} digits, got '{}'",
                                       kLocalBlockDigits, suffix4));
        }
        spec.exactSuffix4 = std::move(suffix4);
    }
    if (!suffix3.empty()) {
        if (!isDigitString(suffix3, kLocalBlockDigits - 1)) {
            return invalid(fmt::format("suffix3 must be exactly {} digits, got '{}'",
                                       kLocalBlockDigits - 1, suffix3));
        }
        spec.exactSuffix3 = std::move(suffix3);
    }

    for (int op : raw.operators) {
        if (op < kMinOperatorCode || op > kMaxOperatorCode) {
            return invalid(fmt::format("invalid operator code: {}", op));
        }
        spec.operators.push_back(static_cast<OperatorCode>(op));
    }
    std::sort(spec.operators.begin(), spec.operators.end());
    spec.operators.erase(std::unique(spec.operators.begin(), spec.operators.end()),
                         spec.operators.end());

    return spec;
}

}  // namespace numgen::gen
