#pragma once

/*
 * modelfetch downloader - caller-facing task manager
 *
 * DownloadManager owns one instance of every component (task store, statistics, executor,
 * scheduler, batch coordinator, progress aggregator and cleanup sweeper) and exposes the
 * operations used by the route layer and the CLI. Nothing here is global; tests construct
 * as many managers as they like with fake collaborators.
 */

#include <modelfetch/config/manager_config.h>
#include <modelfetch/core/types.h>
#include <modelfetch/downloader/batch_coordinator.hpp>
#include <modelfetch/downloader/cleanup_sweeper.hpp>
#include <modelfetch/downloader/download_task.hpp>
#include <modelfetch/downloader/progress_aggregator.hpp>
#include <modelfetch/downloader/scheduler.hpp>
#include <modelfetch/downloader/statistics_accumulator.hpp>
#include <modelfetch/downloader/task_store.hpp>
#include <modelfetch/downloader/transfer_executor.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace modelfetch::downloader {

class DownloadManager {
public:
    /**
     * Production wiring: libcurl adapter and the POSIX disk writer.
     */
    explicit DownloadManager(config::ManagerConfig cfg);

    /**
     * Injected collaborators (tests, alternative transports).
     */
    DownloadManager(config::ManagerConfig cfg, std::unique_ptr<IHttpAdapter> http,
                    std::unique_ptr<IDiskWriter> disk);

    ~DownloadManager();

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // ---- task lifecycle ----

    /**
     * Queue a download. Returns the new task id; admission happens on a worker thread.
     */
    Result<TaskId> install(const DownloadRequest& request);

    bool pause(std::string_view id);
    bool resume(std::string_view id);
    bool cancel(std::string_view id, std::optional<bool> keepPartial = std::nullopt);

    // ---- queries ----

    [[nodiscard]] std::vector<TaskSnapshot> getActiveTasks() const;
    [[nodiscard]] std::optional<TaskSnapshot> getTask(std::string_view id) const;
    [[nodiscard]] std::optional<ProgressSnapshot> getDownloadProgress(std::string_view id) const;
    [[nodiscard]] DownloadStatistics getDownloadStats() const;
    void resetStats();

    /**
     * Block until the task is terminal, the timeout passes or the manager shuts down.
     * nullopt for unknown ids.
     */
    std::optional<TaskSnapshot>
    waitForTask(std::string_view id,
                std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;

    // ---- composite operations ----

    std::vector<BatchOutcome> downloadBatch(const std::vector<DownloadRequest>& requests);

    /**
     * Enqueue and wait. A task still running when the timeout expires is cancelled; one
     * interrupted by shutdown is left paused.
     */
    DownloadResult downloadModel(const DownloadRequest& request,
                                 std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * Hash a file on disk and compare it with "<algo>:<hex>".
     */
    Result<bool> verifyDownload(const std::filesystem::path& path,
                                std::string_view expectedChecksum) const;

    SweepStats cleanupTasks(bool force = false);

    /**
     * Stop workers and the periodic sweeper. Running transfers are paused, not cancelled.
     * Called by the destructor.
     */
    void shutdown();

    [[nodiscard]] const config::ManagerConfig& config() const noexcept { return config_; }

private:
    void init();

    config::ManagerConfig config_;
    std::unique_ptr<IHttpAdapter> http_;
    std::unique_ptr<IDiskWriter> disk_;

    TaskStore store_;
    StatisticsAccumulator stats_;
    std::unique_ptr<TransferExecutor> executor_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<BatchCoordinator> batch_;
    std::unique_ptr<ProgressAggregator> progress_;
    std::unique_ptr<CleanupSweeper> sweeper_;
};

} // namespace modelfetch::downloader
