// =============================================================================
// numgen - Error Handling Framework Implementation
// =============================================================================

#include "numgen/common/error.h"

#include <fmt/format.h>

namespace numgen {

// =============================================================================
// NumgenException Implementation
// =============================================================================

void NumgenException::formatWhat() {
    what_ = fmt::format("[{}] {}", errorCodeToString(code_), message_);
    if (path_) {
        what_ += fmt::format(" (file: {})", path_->string());
    }
}

// =============================================================================
// IOError / OverCapacityError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

std::string OverCapacityError::formatOverCapacity(std::uint64_t limit, std::uint64_t actual) {
    return fmt::format("result of {} identifiers exceeds the limit of {}; narrow the filter",
                       actual, limit);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
        case ErrorCode::kDestinationUnwritable:
        case ErrorCode::kDiskExhausted:
        case ErrorCode::kSourceUnreadable:
            throw IOError(code_, message_);
        case ErrorCode::kInvalidFilter:
            throw InvalidFilterError(message_);
        case ErrorCode::kOverCapacity:
            throw OverCapacityError(message_);
        default:
            break;
    }
    throw NumgenException(code_, message_);
}

}  // namespace numgen
