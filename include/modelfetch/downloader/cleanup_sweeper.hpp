#pragma once

#include <modelfetch/downloader/downloader.hpp>
#include <modelfetch/downloader/task_store.hpp>

#include <chrono>
#include <cstdint>
#include <memory>

namespace modelfetch::downloader {

struct SweepStats {
    std::uint64_t tasksScanned{0};
    std::uint64_t tasksRemoved{0};
    std::uint64_t partialsRemoved{0};
    std::uint64_t bytesReclaimed{0};
    std::chrono::milliseconds duration{0};
};

struct SweepOptions {
    std::chrono::seconds retention{std::chrono::hours(24)};
};

/**
 * Evicts terminal task records past their retention window and reclaims the partial
 * artifacts they leave behind. Live tasks (Queued, Downloading, Paused) and completed
 * artifacts at their destination are never touched.
 */
class CleanupSweeper {
public:
    CleanupSweeper(TaskStore& store, IDiskWriter& disk, SweepOptions options = {});
    ~CleanupSweeper();

    CleanupSweeper(const CleanupSweeper&) = delete;
    CleanupSweeper& operator=(const CleanupSweeper&) = delete;

    /**
     * Run one sweep. force ignores the retention window. Concurrent sweeps are serialized.
     */
    SweepStats sweep(bool force = false) noexcept;

    // Periodic sweeping on a background thread
    void scheduleSweeps(std::chrono::milliseconds interval);
    void stopScheduledSweeps();

    [[nodiscard]] SweepStats getLastStats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace modelfetch::downloader
