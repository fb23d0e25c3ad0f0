// =============================================================================
// numgen - Size Formatting Implementation
// =============================================================================

#include "numgen/common/size_format.h"

#include <array>
#include <string_view>

#include <fmt/format.h>

namespace numgen {

std::string formatFileSize(std::uint64_t bytes) {
    constexpr std::array<std::string_view, 5> kUnits = {"B", "KB", "MB", "GB", "TB"};

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }

    return fmt::format("{:.2f} {}", value, kUnits[unit]);
}

}  // namespace numgen
