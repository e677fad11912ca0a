/*
 * modelfetch/src/downloader/download_manager.cpp
 *
 * Wiring of the task manager components plus the composite operations
 * (synchronous downloadModel, verifyDownload).
 */

#include <modelfetch/downloader/download_manager.hpp>

#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

namespace modelfetch::downloader {

namespace {
using CoreError = modelfetch::Error;
using CoreCode = modelfetch::ErrorCode;
} // namespace

DownloadManager::DownloadManager(config::ManagerConfig cfg)
    : DownloadManager(std::move(cfg), makeCurlHttpAdapter(), makeDiskWriter()) {}

DownloadManager::DownloadManager(config::ManagerConfig cfg, std::unique_ptr<IHttpAdapter> http,
                                 std::unique_ptr<IDiskWriter> disk)
    : config_(std::move(cfg)), http_(std::move(http)), disk_(std::move(disk)) {
    init();
}

DownloadManager::~DownloadManager() {
    shutdown();
}

void DownloadManager::init() {
    ExecutorConfig ec;
    ec.chunkSizeBytes = config_.chunkSizeBytes;
    ec.progressInterval = config_.progressInterval;
    ec.maxFileBytes = config_.maxFileBytes;
    ec.fsyncOnComplete = config_.fsyncOnComplete;
    executor_ = std::make_unique<TransferExecutor>(
        ec, *http_, *disk_, [this](const DownloadTask& task) { stats_.record(task); });

    SchedulerConfig sc;
    sc.maxConcurrentDownloads = config_.maxConcurrentDownloads;
    sc.maxCacheBytes = config_.maxCacheBytes;
    sc.cacheDir = config_.cacheDir;
    sc.keepPartialOnCancel = config_.keepPartialOnCancel;
    sc.partialSuffix = config_.partialSuffix;
    sc.defaultFetch.timeout = config_.requestTimeout;
    sc.defaultFetch.tls = config_.tls;
    sc.defaultFetch.proxy = config_.proxy;
    sc.defaultRetry = config_.retry;
    scheduler_ = std::make_unique<Scheduler>(std::move(sc), store_, *executor_, *disk_, stats_);

    batch_ = std::make_unique<BatchCoordinator>(*scheduler_, store_);
    progress_ = std::make_unique<ProgressAggregator>(store_, config_.speedWindow);
    sweeper_ = std::make_unique<CleanupSweeper>(store_, *disk_, SweepOptions{config_.retention});

    if (!config_.cacheDir.empty()) {
        std::error_code ec2;
        std::filesystem::create_directories(config_.cacheDir, ec2);
        if (ec2) {
            spdlog::warn("Could not create cache directory {}: {}", config_.cacheDir.string(),
                         ec2.message());
        }
    }

    scheduler_->start();
    if (config_.sweepInterval.count() > 0)
        sweeper_->scheduleSweeps(config_.sweepInterval);

    spdlog::debug("DownloadManager ready (cache={}, workers={}, chunk={}B)",
                  config_.cacheDir.string(), config_.maxConcurrentDownloads,
                  config_.chunkSizeBytes);
}

void DownloadManager::shutdown() {
    if (sweeper_)
        sweeper_->stopScheduledSweeps();
    if (scheduler_)
        scheduler_->stop();
}

Result<TaskId> DownloadManager::install(const DownloadRequest& request) {
    return scheduler_->enqueue(request);
}

bool DownloadManager::pause(std::string_view id) {
    return scheduler_->pause(id);
}

bool DownloadManager::resume(std::string_view id) {
    return scheduler_->resume(id);
}

bool DownloadManager::cancel(std::string_view id, std::optional<bool> keepPartial) {
    return scheduler_->cancel(id, keepPartial);
}

std::vector<TaskSnapshot> DownloadManager::getActiveTasks() const {
    return scheduler_->getActiveTasks();
}

std::optional<TaskSnapshot> DownloadManager::getTask(std::string_view id) const {
    auto entry = store_.find(id);
    if (!entry)
        return std::nullopt;
    std::lock_guard lk(entry->mutex);
    return makeSnapshot(entry->task);
}

std::optional<ProgressSnapshot> DownloadManager::getDownloadProgress(std::string_view id) const {
    return progress_->getDownloadProgress(id);
}

DownloadStatistics DownloadManager::getDownloadStats() const {
    return stats_.snapshot();
}

void DownloadManager::resetStats() {
    stats_.reset();
}

std::optional<TaskSnapshot>
DownloadManager::waitForTask(std::string_view id,
                             std::optional<std::chrono::milliseconds> timeout) const {
    auto entry = store_.find(id);
    if (!entry)
        return std::nullopt;
    return batch_->waitForTerminal(entry, timeout);
}

std::vector<BatchOutcome>
DownloadManager::downloadBatch(const std::vector<DownloadRequest>& requests) {
    return batch_->downloadBatch(requests);
}

DownloadResult DownloadManager::downloadModel(const DownloadRequest& request,
                                              std::optional<std::chrono::milliseconds> timeout) {
    DownloadResult out;
    const auto started = std::chrono::steady_clock::now();

    auto queued = scheduler_->enqueue(request);
    if (!queued) {
        out.error = queued.error().message;
        return out;
    }
    out.taskId = queued.value();

    auto snapshot = waitForTask(out.taskId, timeout);
    if (snapshot && !isTerminal(snapshot->state) && !scheduler_->isAccepting()) {
        // Shut down underneath us; the task stays resumable.
        out.error = "Download manager shut down";
    } else if (snapshot && !isTerminal(snapshot->state)) {
        spdlog::warn("Download {} did not finish within {} ms; cancelling", out.taskId,
                     timeout ? timeout->count() : 0);
        scheduler_->cancel(out.taskId);
        out.error = "Download timed out";
        snapshot = getTask(out.taskId);
    }

    out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (!snapshot) {
        // Only a forced sweep racing with us can drop the record this early.
        out.error = out.error.value_or("Task record no longer available");
        return out;
    }

    out.fileSize = snapshot->bytesTransferred;
    out.checksum = snapshot->checksum;
    out.success = snapshot->state == TaskState::Completed;
    if (out.success) {
        out.filePath = snapshot->destinationPath;
    } else if (!out.error) {
        out.error = snapshot->lastError.value_or(std::string("Download ") +
                                                 toString(snapshot->state));
    }
    return out;
}

Result<bool> DownloadManager::verifyDownload(const std::filesystem::path& path,
                                             std::string_view expectedChecksum) const {
    auto expected = parseChecksum(expectedChecksum);
    if (!expected) {
        return CoreError{CoreCode::InvalidArgument,
                         "Malformed checksum '" + std::string(expectedChecksum) + "'"};
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return CoreError{CoreCode::FileNotFound, "File not found: " + path.string()};
    }

    auto actual = computeFileChecksum(path, expected->algo);
    if (!actual) {
        return CoreError{CoreCode::PermissionDenied, "Failed to read " + path.string()};
    }

    const bool match = actual->hex == expected->hex;
    if (!match) {
        spdlog::warn("Checksum mismatch for {}: expected {}, got {}", path.string(),
                     formatChecksum(*expected), formatChecksum(*actual));
    }
    return match;
}

SweepStats DownloadManager::cleanupTasks(bool force) {
    return sweeper_->sweep(force);
}

} // namespace modelfetch::downloader
