#pragma once

#include <modelfetch/downloader/download_task.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace modelfetch::downloader {

/**
 * One committed chunk, used by the progress aggregator's sliding speed window.
 */
struct RateSample {
    std::chrono::steady_clock::time_point at;
    std::uint64_t bytesTransferred{0};
};

/**
 * A task record plus the synchronization owned by it.
 *
 * Lock order is always TaskStore::mutex_ before TaskEntry::mutex; nothing that holds an
 * entry mutex may call back into the store.
 */
struct TaskEntry {
    explicit TaskEntry(DownloadTask t) : task(std::move(t)) {}

    TaskEntry(const TaskEntry&) = delete;
    TaskEntry& operator=(const TaskEntry&) = delete;

    mutable std::mutex mutex;
    std::condition_variable changed; // notified on every state transition

    DownloadTask task;
    std::deque<RateSample> samples;
    std::optional<std::chrono::steady_clock::time_point> runningSince;

    // Written under `mutex`, read lock-free by the transfer layer between chunks.
    std::atomic<std::uint64_t> epoch{0}; // bumped on every admission into Downloading
    std::atomic<bool> stopRequested{false};

    /**
     * Apply a validated transition. Caller must hold `mutex`.
     * Leaving Downloading for anything but Completed pins resumeOffset to bytesTransferred.
     */
    bool transitionLocked(TaskState to);
};

using TaskEntryPtr = std::shared_ptr<TaskEntry>;

/**
 * Thread-safe id -> task record map. The single piece of shared mutable state of the
 * manager; entries are handed out as shared_ptr so readers and executors keep a record
 * alive even after the sweeper drops it from the map.
 */
class TaskStore {
public:
    TaskStore() = default;
    TaskStore(const TaskStore&) = delete;
    TaskStore& operator=(const TaskStore&) = delete;

    /**
     * Insert a new record, assigning its creation sequence. Returns nullptr when the id is
     * taken, or when requireFreeDestination is set and a non-terminal task already targets
     * the same destination path.
     */
    TaskEntryPtr tryInsert(DownloadTask task, bool requireFreeDestination = true);

    [[nodiscard]] TaskEntryPtr find(std::string_view id) const;

    /**
     * All entries in creation order.
     */
    [[nodiscard]] std::vector<TaskEntryPtr> entries() const;

    /**
     * Snapshots of records matching pred, in creation order.
     */
    [[nodiscard]] std::vector<TaskSnapshot>
    snapshots(const std::function<bool(const DownloadTask&)>& pred) const;

    /**
     * Remove every record matching pred (evaluated under the record's lock) and return the
     * removed records.
     */
    std::vector<DownloadTask> eraseIf(const std::function<bool(const DownloadTask&)>& pred);

    /**
     * True when a non-terminal task other than excludeId targets destination.
     */
    [[nodiscard]] bool destinationInUse(const std::filesystem::path& destination,
                                        std::string_view excludeId = {}) const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TaskEntryPtr> tasks_;
    std::uint64_t nextSequence_{1};
};

} // namespace modelfetch::downloader
