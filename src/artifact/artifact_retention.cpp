// =============================================================================
// numgen - Artifact Retention Implementation
// =============================================================================

#include "numgen/artifact/artifact_retention.h"

#include <system_error>
#include <utility>
#include <vector>

#include "numgen/common/logger.h"

namespace numgen::artifact {

ArtifactRetention::ArtifactRetention(std::filesystem::path storeDir)
    : storeDir_(std::move(storeDir)) {}

std::uint64_t ArtifactRetention::sweep(std::chrono::seconds maxAge) const {
    return sweep(maxAge, std::filesystem::file_time_type::clock::now());
}

std::uint64_t ArtifactRetention::sweep(std::chrono::seconds maxAge,
                                       std::filesystem::file_time_type now) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(storeDir_, ec)) {
        NUMGEN_LOG_DEBUG("Retention skipped, store {} does not exist", storeDir_.string());
        return 0;
    }

    std::vector<std::filesystem::path> expired;
    std::filesystem::directory_iterator it(storeDir_, ec);
    if (ec) {
        NUMGEN_LOG_DEBUG("Retention cannot list {}: {}", storeDir_.string(), ec.message());
        return 0;
    }
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) {
            NUMGEN_LOG_DEBUG("Retention listing stopped early: {}", ec.message());
            break;
        }
        std::error_code entryEc;
        if (!it->is_regular_file(entryEc)) {
            continue;
        }
        const auto modified = it->last_write_time(entryEc);
        if (entryEc) {
            NUMGEN_LOG_DEBUG("Cannot stat {}: {}", it->path().string(), entryEc.message());
            continue;
        }
        // Compare in seconds: maxAge in file-clock ticks can exceed the tick range
        if (std::chrono::duration_cast<std::chrono::seconds>(now - modified) > maxAge) {
            expired.push_back(it->path());
        }
    }

    std::uint64_t deleted = 0;
    for (const auto& path : expired) {
        std::error_code removeEc;
        if (std::filesystem::remove(path, removeEc)) {
            ++deleted;
            NUMGEN_LOG_DEBUG("Expired {}", path.filename().string());
        } else if (removeEc) {
            NUMGEN_LOG_DEBUG("Cannot delete {}: {}", path.string(), removeEc.message());
        }
    }

    if (deleted > 0) {
        NUMGEN_LOG_INFO("Retention removed {} expired file(s) from {}", deleted,
                        storeDir_.string());
    }
    return deleted;
}

RetentionScheduler::RetentionScheduler(const ArtifactRetention& retention,
                                       std::chrono::seconds maxAge,
                                       std::chrono::seconds interval)
    : retention_(retention), maxAge_(maxAge), interval_(interval) {}

RetentionScheduler::~RetentionScheduler() { stop(); }

void RetentionScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stopRequested_ = false;
    sweeps_ = 0;
    deleted_ = 0;
    worker_ = std::thread([this] { run(); });
}

void RetentionScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopRequested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool RetentionScheduler::running() const noexcept { return worker_.joinable(); }

std::uint64_t RetentionScheduler::sweepsCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sweeps_;
}

std::uint64_t RetentionScheduler::filesDeleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deleted_;
}

void RetentionScheduler::run() {
    NUMGEN_LOG_DEBUG("Retention scheduler started (interval {}s, max age {}s)", interval_.count(),
                     maxAge_.count());
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopRequested_) {
        lock.unlock();
        const std::uint64_t removed = retention_.sweep(maxAge_);
        lock.lock();
        ++sweeps_;
        deleted_ += removed;
        wake_.wait_for(lock, interval_, [this] { return stopRequested_; });
    }
    NUMGEN_LOG_DEBUG("Retention scheduler stopped after {} sweep(s)", sweeps_);
}

}  // namespace numgen::artifact
