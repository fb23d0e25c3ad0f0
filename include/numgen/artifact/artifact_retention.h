// =============================================================================
// numgen - Artifact Retention
// =============================================================================
// Time-based removal of stale artifacts and partitions from the store.
//
// A sweep scans the store directory (non-recursively), takes each regular
// file's age from its last-modified time and deletes it when the age exceeds
// the configured maximum. Per-file failures, including a file vanishing
// between listing and deletion, are logged at debug level and skipped.
//
// RetentionScheduler repeats the sweep on a background thread.
// =============================================================================

#ifndef NUMGEN_ARTIFACT_ARTIFACT_RETENTION_H
#define NUMGEN_ARTIFACT_ARTIFACT_RETENTION_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <thread>

namespace numgen::artifact {

class ArtifactRetention {
public:
    explicit ArtifactRetention(std::filesystem::path storeDir);

    /// @brief Delete files older than @p maxAge.
    /// @return Number of files actually deleted. A missing store yields 0.
    std::uint64_t sweep(std::chrono::seconds maxAge) const;

    /// @brief Sweep against an explicit reference time.
    std::uint64_t sweep(std::chrono::seconds maxAge,
                        std::filesystem::file_time_type now) const;

    [[nodiscard]] const std::filesystem::path& storeDir() const noexcept { return storeDir_; }

private:
    std::filesystem::path storeDir_;
};

class RetentionScheduler {
public:
    /// @brief Construct a scheduler; nothing runs until start().
    /// @param retention Sweeper to run; must outlive the scheduler.
    /// @param maxAge Age passed to every sweep.
    /// @param interval Delay between sweeps.
    RetentionScheduler(const ArtifactRetention& retention, std::chrono::seconds maxAge,
                       std::chrono::seconds interval);

    ~RetentionScheduler();

    RetentionScheduler(const RetentionScheduler&) = delete;
    RetentionScheduler& operator=(const RetentionScheduler&) = delete;

    /// @brief Start sweeping; the first sweep runs immediately.
    void start();

    /// @brief Stop and join the worker. Safe to call more than once.
    void stop();

    [[nodiscard]] bool running() const noexcept;

    /// @brief Sweeps completed since start().
    [[nodiscard]] std::uint64_t sweepsCompleted() const;

    /// @brief Files deleted across all sweeps since start().
    [[nodiscard]] std::uint64_t filesDeleted() const;

private:
    void run();

    const ArtifactRetention& retention_;
    std::chrono::seconds maxAge_;
    std::chrono::seconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopRequested_ = false;
    std::uint64_t sweeps_ = 0;
    std::uint64_t deleted_ = 0;
    std::thread worker_;
};

}  // namespace numgen::artifact

#endif  // NUMGEN_ARTIFACT_ARTIFACT_RETENTION_H
