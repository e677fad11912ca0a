#pragma once

#include <modelfetch/core/types.h>
#include <modelfetch/downloader/statistics_accumulator.hpp>
#include <modelfetch/downloader/task_store.hpp>
#include <modelfetch/downloader/transfer_executor.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace modelfetch::downloader {

struct SchedulerConfig {
    std::size_t maxConcurrentDownloads{3};
    std::uint64_t maxCacheBytes{0}; // 0 = no ceiling
    std::filesystem::path cacheDir; // relative destinations resolve here
    bool keepPartialOnCancel{false};
    std::string partialSuffix{".part"};
    FetchOptions defaultFetch{};
    RetryPolicy defaultRetry{};
};

/**
 * Bounded worker pool with FIFO admission.
 *
 * Workers pop task entries from one queue and run them through the TransferExecutor.
 * pause/cancel change the record immediately under its lock and raise the stop flag; the
 * executor notices within one chunk and gives up its slot.
 */
class Scheduler {
public:
    Scheduler(SchedulerConfig config, TaskStore& store, TransferExecutor& executor,
              IDiskWriter& disk, StatisticsAccumulator& stats);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void start();

    /**
     * Stop admitting, pause every Downloading task (keeping its partial artifact for a later
     * resume) and join the workers. Queued tasks stay Queued.
     */
    void stop();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    /**
     * False once stop() has begun; queued and paused tasks will not be admitted again.
     * Takes the queue lock, so it may be called with a task mutex held but not the reverse.
     */
    [[nodiscard]] bool isAccepting() const;

    /**
     * A partial artifact left at the destination (a cancel that kept its bytes, or an
     * earlier process) is adopted as the resume offset when it fits the expected size.
     */
    Result<TaskId> enqueue(const DownloadRequest& request);

    bool pause(std::string_view id);
    bool resume(std::string_view id);
    bool cancel(std::string_view id, std::optional<bool> keepPartial = std::nullopt);

    /**
     * Queued and Downloading tasks in creation order.
     */
    [[nodiscard]] std::vector<TaskSnapshot> getActiveTasks() const;

    [[nodiscard]] std::size_t pendingAdmissions() const;
    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

private:
    void workerLoop(std::size_t index);
    void admit(const TaskEntryPtr& entry);
    void adoptPartialLocked(TaskEntry& entry);
    Result<void> checkCapacity(std::uint64_t requestBytes) const;
    std::filesystem::path resolveDestination(const std::filesystem::path& dest) const;

    SchedulerConfig config_;
    TaskStore& store_;
    TransferExecutor& executor_;
    IDiskWriter& disk_;
    StatisticsAccumulator& stats_;

    mutable std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<TaskEntryPtr> queue_;
    bool stopping_{false};
    bool accepting_{true};

    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::mutex lifecycleMutex_;
};

} // namespace modelfetch::downloader
