// =============================================================================
// numgen - Error Handling Framework
// =============================================================================
// Error handling for the numgen library and CLI.
//
// Components return Result<T> (std::expected<T, Error>). The exception
// hierarchy covers the few paths that throw and converts to and from Error.
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/configuration error
// - 2: Generic I/O error
// - 3: Invalid filter
// - 4: No matching segments
// - 5: Over capacity
// - 6..13: see ErrorCode
// =============================================================================

#ifndef NUMGEN_COMMON_ERROR_H
#define NUMGEN_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace numgen {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage, argument or configuration error.
    kUsageError = 1,

    /// @brief Generic I/O error.
    kIOError = 2,

    /// @brief Malformed filter, rejected before generation.
    kInvalidFilter = 3,

    /// @brief The filter resolved to zero segments.
    /// @note Only used as an exit code; the engine reports this as an empty result.
    kNoMatches = 4,

    /// @brief Deduplicated identifier count exceeds the configured maximum.
    kOverCapacity = 5,

    /// @brief Store directory missing or artifact file not creatable.
    kDestinationUnwritable = 6,

    /// @brief Write failed mid-stream (disk full, I/O error).
    kDiskExhausted = 7,

    /// @brief Artifact exists but cannot be opened or read.
    kSourceUnreadable = 8,

    /// @brief Artifact was already removed by retention.
    kArtifactExpired = 9,

    /// @brief Operation was cancelled.
    kCancelled = 10,

    /// @brief Segment lookup failed.
    kLookupFailed = 11,

    /// @brief Invalid argument value.
    kInvalidArgument = 12,

    /// @brief Partitions do not reproduce their source artifact.
    kVerificationFailed = 13
};

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kInvalidFilter:
            return "invalid filter";
        case ErrorCode::kNoMatches:
            return "no matches";
        case ErrorCode::kOverCapacity:
            return "over capacity";
        case ErrorCode::kDestinationUnwritable:
            return "destination unwritable";
        case ErrorCode::kDiskExhausted:
            return "disk exhausted";
        case ErrorCode::kSourceUnreadable:
            return "source unreadable";
        case ErrorCode::kArtifactExpired:
            return "artifact expired";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kLookupFailed:
            return "lookup failed";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kVerificationFailed:
            return "verification failed";
    }
    return "unknown error";
}

/// @brief Check if an error code represents an environmental storage failure.
/// @note These are not user-actionable and are reported as a generic
///       "generation failed" outcome.
[[nodiscard]] constexpr bool isStorageFailure(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kIOError:
        case ErrorCode::kDestinationUnwritable:
        case ErrorCode::kDiskExhausted:
        case ErrorCode::kSourceUnreadable:
        case ErrorCode::kVerificationFailed:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Exceptions
// =============================================================================

/// @brief Base exception class for all numgen errors.
/// @note Thrown only where Result cannot be returned (constructors, CLI
///       parsing); convert with Error(ex) at the boundary.
class NumgenException : public std::exception {
public:
    NumgenException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct for a failure tied to a file.
    NumgenException(ErrorCode code, std::string message, std::filesystem::path path)
        : code_(code), message_(std::move(message)), path_(std::move(path)) {
        formatWhat();
    }

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief The message without category or path.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<std::filesystem::path>& path() const noexcept {
        return path_;
    }

private:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<std::filesystem::path> path_;
    std::string what_;
};

class UsageError : public NumgenException {
public:
    explicit UsageError(std::string message)
        : NumgenException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Storage failure; the code is kIOError or one of the specific
///        storage codes (kDestinationUnwritable, kDiskExhausted,
///        kSourceUnreadable).
class IOError : public NumgenException {
public:
    explicit IOError(std::string message)
        : NumgenException(ErrorCode::kIOError, std::move(message)) {}

    IOError(ErrorCode code, std::string message) : NumgenException(code, std::move(message)) {}

    /// @brief "message: reason (error code: N)" for a failed filesystem call.
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

class InvalidFilterError : public NumgenException {
public:
    explicit InvalidFilterError(std::string message)
        : NumgenException(ErrorCode::kInvalidFilter, std::move(message)) {}
};

/// @brief Request whose deduplicated output exceeds the configured maximum.
class OverCapacityError : public NumgenException {
public:
    explicit OverCapacityError(std::string message)
        : NumgenException(ErrorCode::kOverCapacity, std::move(message)) {}

    OverCapacityError(std::uint64_t limit, std::uint64_t actual)
        : NumgenException(ErrorCode::kOverCapacity, formatOverCapacity(limit, actual)),
          limit_(limit),
          actual_(actual) {}

    [[nodiscard]] std::optional<std::uint64_t> limit() const noexcept { return limit_; }
    [[nodiscard]] std::optional<std::uint64_t> actual() const noexcept { return actual_; }

    static std::string formatOverCapacity(std::uint64_t limit, std::uint64_t actual);

private:
    std::optional<std::uint64_t> limit_;
    std::optional<std::uint64_t> actual_;
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a NumgenException.
    explicit Error(const NumgenException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the matching exception type.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an Error object.
template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Unwrap a Result, throwing the matching exception on error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

}  // namespace numgen

#endif  // NUMGEN_COMMON_ERROR_H
