// =============================================================================
// numgen - Cancellation Token
// =============================================================================
// Caller-owned cancellation signal polled by long-running operations.
//
// A token is cancelled either explicitly (cancel(), async-signal-safe) or by
// passing an optional deadline. Generation checks it between segment
// expansions and the artifact writer checks it between write batches.
// =============================================================================

#ifndef NUMGEN_COMMON_CANCELLATION_H
#define NUMGEN_COMMON_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <optional>

namespace numgen {

class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    CancellationToken() = default;

    /// @brief Construct a token that cancels itself at @p deadline.
    explicit CancellationToken(Clock::time_point deadline) : deadline_(deadline) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// @brief Request cancellation.
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    /// @brief Check whether cancellation was requested or the deadline passed.
    [[nodiscard]] bool isCancelled() const noexcept {
        if (cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        return deadline_.has_value() && Clock::now() >= *deadline_;
    }

    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept { return deadline_; }

private:
    std::atomic<bool> cancelled_{false};
    std::optional<Clock::time_point> deadline_;
};

/// @brief Null-tolerant check used by components that take an optional token.
[[nodiscard]] inline bool isCancelled(const CancellationToken* token) noexcept {
    return token != nullptr && token->isCancelled();
}

}  // namespace numgen

#endif  // NUMGEN_COMMON_CANCELLATION_H
