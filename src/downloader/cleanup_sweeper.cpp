#include <modelfetch/downloader/cleanup_sweeper.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

namespace modelfetch::downloader {

struct CleanupSweeper::Impl {
    TaskStore& store;
    IDiskWriter& disk;
    SweepOptions options;

    std::mutex sweepMutex;

    // Scheduling state
    std::thread schedulerThread;
    std::condition_variable schedulerCv;
    std::mutex schedulerMutex;
    std::atomic<bool> stopScheduler{false};

    mutable std::mutex statsMutex;
    SweepStats lastStats;

    Impl(TaskStore& s, IDiskWriter& d, SweepOptions o) : store(s), disk(d), options(o) {}

    ~Impl() { stopScheduledSweeps(); }

    void stopScheduledSweeps() {
        {
            std::lock_guard lock(schedulerMutex);
            stopScheduler = true;
        }
        schedulerCv.notify_all();
        if (schedulerThread.joinable()) {
            schedulerThread.join();
        }
    }
};

CleanupSweeper::CleanupSweeper(TaskStore& store, IDiskWriter& disk, SweepOptions options)
    : pImpl(std::make_unique<Impl>(store, disk, options)) {}

CleanupSweeper::~CleanupSweeper() = default;

SweepStats CleanupSweeper::sweep(bool force) noexcept {
    std::lock_guard sweepLock(pImpl->sweepMutex);
    const auto startTime = std::chrono::steady_clock::now();
    SweepStats stats{};

    try {
        stats.tasksScanned = pImpl->store.size();
        const auto cutoff = std::chrono::system_clock::now() - pImpl->options.retention;

        auto removed = pImpl->store.eraseIf([&](const DownloadTask& t) {
            return isTerminal(t.state) && (force || t.updatedAt < cutoff);
        });
        stats.tasksRemoved = removed.size();

        for (const auto& task : removed) {
            if (task.state == TaskState::Completed)
                continue;
            // A live task for the same destination reuses this partial path.
            if (pImpl->store.destinationInUse(task.destinationPath))
                continue;
            auto size = pImpl->disk.sizeOf(task.partialPath);
            if (!size)
                continue;
            if (pImpl->disk.remove(task.partialPath)) {
                ++stats.partialsRemoved;
                stats.bytesReclaimed += *size;
                spdlog::debug("Sweeper removed orphaned partial {} ({} bytes)",
                              task.partialPath.string(), *size);
            }
        }
    } catch (const std::exception& e) {
        spdlog::error("Task sweep failed: {}", e.what());
    }

    stats.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);
    if (stats.tasksRemoved > 0 || stats.partialsRemoved > 0) {
        spdlog::info("Task sweep: {} scanned, {} removed, {} partial(s) reclaimed ({} bytes)",
                     stats.tasksScanned, stats.tasksRemoved, stats.partialsRemoved,
                     stats.bytesReclaimed);
    }

    {
        std::lock_guard lock(pImpl->statsMutex);
        pImpl->lastStats = stats;
    }
    return stats;
}

void CleanupSweeper::scheduleSweeps(std::chrono::milliseconds interval) {
    stopScheduledSweeps();
    if (interval.count() <= 0)
        return;

    pImpl->stopScheduler = false;
    pImpl->schedulerThread = std::thread([this, interval]() {
        spdlog::info("Started scheduled task sweeps (interval: {}ms)", interval.count());
        while (!pImpl->stopScheduler) {
            {
                std::unique_lock lock(pImpl->schedulerMutex);
                if (pImpl->schedulerCv.wait_for(lock, interval,
                                                [this] { return pImpl->stopScheduler.load(); })) {
                    break;
                }
            }
            sweep(false);
        }
        spdlog::info("Stopped scheduled task sweeps");
    });
}

void CleanupSweeper::stopScheduledSweeps() {
    pImpl->stopScheduledSweeps();
}

SweepStats CleanupSweeper::getLastStats() const {
    std::lock_guard lock(pImpl->statsMutex);
    return pImpl->lastStats;
}

} // namespace modelfetch::downloader
