/*
 * modelfetch/src/downloader/scheduler.cpp
 *
 * Fixed-size worker pool over a FIFO queue of task entries.
 *
 * - enqueue validates, checks the cache ceiling, inserts a Queued record and wakes a worker
 * - a worker admits the oldest entry that is still Queued (cancelled entries are skipped)
 *   and runs the executor under the admission epoch it just created
 * - pause/cancel never block on the executor; they flip the record and raise stopRequested
 */

#include <modelfetch/core/uuid.h>
#include <modelfetch/downloader/scheduler.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace modelfetch::downloader {

namespace {
// downloader::Error shadows the manager-level error type in this namespace.
using CoreError = modelfetch::Error;
using CoreCode = modelfetch::ErrorCode;
} // namespace

Scheduler::Scheduler(SchedulerConfig config, TaskStore& store, TransferExecutor& executor,
                     IDiskWriter& disk, StatisticsAccumulator& stats)
    : config_(std::move(config)), store_(store), executor_(executor), disk_(disk),
      stats_(stats) {
    if (config_.maxConcurrentDownloads == 0)
        config_.maxConcurrentDownloads = 1;
    if (config_.partialSuffix.empty())
        config_.partialSuffix = ".part";
}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    std::lock_guard lifecycle(lifecycleMutex_);
    if (running_.load())
        return;
    {
        std::lock_guard lk(queueMutex_);
        stopping_ = false;
        accepting_ = true;
    }
    workers_.reserve(config_.maxConcurrentDownloads);
    for (std::size_t i = 0; i < config_.maxConcurrentDownloads; ++i) {
        workers_.emplace_back([this, i] { workerLoop(i); });
    }
    running_.store(true);
    spdlog::info("Download scheduler started with {} worker(s)", config_.maxConcurrentDownloads);
}

void Scheduler::stop() {
    std::lock_guard lifecycle(lifecycleMutex_);
    {
        std::lock_guard lk(queueMutex_);
        stopping_ = true;
        accepting_ = false;
    }
    queueCv_.notify_all();
    if (!running_.load())
        return;

    std::size_t paused = 0;
    for (const auto& entry : store_.entries()) {
        std::lock_guard el(entry->mutex);
        if (entry->task.state == TaskState::Downloading &&
            entry->transitionLocked(TaskState::Paused)) {
            ++paused;
        }
        // Waiters re-check isAccepting() and give up on tasks that will not run again.
        entry->changed.notify_all();
    }

    for (auto& t : workers_) {
        if (t.joinable())
            t.join();
    }
    workers_.clear();
    running_.store(false);
    spdlog::info("Download scheduler stopped ({} transfer(s) paused)", paused);
}

std::filesystem::path Scheduler::resolveDestination(const std::filesystem::path& dest) const {
    if (dest.is_relative() && !config_.cacheDir.empty())
        return (config_.cacheDir / dest).lexically_normal();
    return dest.lexically_normal();
}

Result<void> Scheduler::checkCapacity(std::uint64_t requestBytes) const {
    if (config_.maxCacheBytes == 0)
        return {};

    std::uint64_t outstanding = 0;
    for (const auto& entry : store_.entries()) {
        std::lock_guard el(entry->mutex);
        const auto& t = entry->task;
        if (!isTerminal(t.state) && t.bytesTotal && *t.bytesTotal > t.bytesTransferred)
            outstanding += *t.bytesTotal - t.bytesTransferred;
    }
    const auto used = disk_.usedBytes(config_.cacheDir);
    if (used + outstanding + requestBytes > config_.maxCacheBytes) {
        return CoreError{CoreCode::ResourceExhausted,
                         fmt::format("Cache ceiling of {} bytes exceeded (used {}, reserved {}, "
                                     "requested {})",
                                     config_.maxCacheBytes, used, outstanding, requestBytes)};
    }
    return {};
}

Result<TaskId> Scheduler::enqueue(const DownloadRequest& request) {
    if (request.sourceRef.empty())
        return CoreError{CoreCode::InvalidArgument, "sourceRef is required"};
    if (request.destinationPath.empty())
        return CoreError{CoreCode::InvalidArgument, "destinationPath is required"};

    std::optional<Checksum> expected;
    if (request.checksum && !request.checksum->empty()) {
        expected = parseChecksum(*request.checksum);
        if (!expected) {
            return CoreError{CoreCode::InvalidArgument,
                             "Malformed checksum '" + *request.checksum +
                                 "' (expected sha256:<hex>, sha512:<hex> or md5:<hex>)"};
        }
    }
    if (request.retry && request.retry->maxAttempts < 1)
        return CoreError{CoreCode::InvalidArgument, "retry.maxAttempts must be at least 1"};

    {
        std::lock_guard lk(queueMutex_);
        if (!accepting_)
            return CoreError{CoreCode::SystemShutdown, "Download scheduler is stopped"};
    }

    if (request.expectedBytes) {
        auto cap = checkCapacity(*request.expectedBytes);
        if (!cap)
            return cap.error();
    }

    DownloadTask task;
    task.id = core::generateUUID();
    task.sourceRef = request.sourceRef;
    task.destinationPath = resolveDestination(request.destinationPath);
    task.partialPath = task.destinationPath;
    task.partialPath += config_.partialSuffix;
    task.state = TaskState::Queued;
    task.bytesTotal = request.expectedBytes;
    task.createdAt = std::chrono::system_clock::now();
    task.updatedAt = task.createdAt;
    task.expectedChecksum = expected;
    task.fetch = config_.defaultFetch;
    task.fetch.headers.insert(task.fetch.headers.end(), request.headers.begin(),
                              request.headers.end());
    if (request.timeout)
        task.fetch.timeout = *request.timeout;
    task.retry = request.retry.value_or(config_.defaultRetry);
    task.keepPartialOnCancel = request.keepPartialOnCancel;

    const auto destination = task.destinationPath;
    auto entry = store_.tryInsert(std::move(task));
    if (!entry) {
        return CoreError{CoreCode::OperationInProgress,
                         "Destination already owned by an active download: " +
                             destination.string()};
    }

    TaskId id;
    {
        std::lock_guard el(entry->mutex);
        id = entry->task.id;
        adoptPartialLocked(*entry);
        spdlog::info("Queued download {}: {} -> {} (offset {})", id, request.sourceRef,
                     destination.string(), entry->task.resumeOffset);
    }
    {
        std::lock_guard lk(queueMutex_);
        queue_.push_back(entry);
    }
    queueCv_.notify_one();
    return id;
}

void Scheduler::adoptPartialLocked(TaskEntry& entry) {
    auto& task = entry.task;
    const auto kept = disk_.sizeOf(task.partialPath);
    if (!kept || *kept == 0)
        return;
    if (task.bytesTotal && *kept > *task.bytesTotal) {
        spdlog::warn("Ignoring partial {} ({} bytes): larger than the expected {} bytes",
                     task.partialPath.string(), *kept, *task.bytesTotal);
        return;
    }
    task.bytesTransferred = *kept;
    task.resumeOffset = *kept;
}

bool Scheduler::pause(std::string_view id) {
    auto entry = store_.find(id);
    if (!entry)
        return false;
    std::lock_guard el(entry->mutex);
    if (entry->task.state != TaskState::Downloading)
        return false;
    if (!entry->transitionLocked(TaskState::Paused))
        return false;
    spdlog::info("Paused download {} at {} bytes", entry->task.id, entry->task.resumeOffset);
    return true;
}

bool Scheduler::resume(std::string_view id) {
    auto entry = store_.find(id);
    if (!entry)
        return false;
    {
        std::lock_guard el(entry->mutex);
        if (entry->task.state != TaskState::Paused)
            return false;
        std::lock_guard lk(queueMutex_);
        if (!accepting_) {
            spdlog::debug("Not resuming download {}: scheduler is stopped", entry->task.id);
            return false;
        }
        if (!entry->transitionLocked(TaskState::Queued))
            return false;
        spdlog::info("Resuming download {} from offset {}", entry->task.id,
                     entry->task.resumeOffset);
        queue_.push_back(entry);
    }
    queueCv_.notify_one();
    return true;
}

bool Scheduler::isAccepting() const {
    std::lock_guard lk(queueMutex_);
    return accepting_;
}

bool Scheduler::cancel(std::string_view id, std::optional<bool> keepPartial) {
    auto entry = store_.find(id);
    if (!entry)
        return false;

    DownloadTask finished;
    bool removedPartial = false;
    {
        std::lock_guard el(entry->mutex);
        if (isTerminal(entry->task.state))
            return false;
        const bool keep = keepPartial.value_or(
            entry->task.keepPartialOnCancel.value_or(config_.keepPartialOnCancel));
        if (!entry->transitionLocked(TaskState::Cancelled))
            return false;
        // Executors only write under this lock while Downloading, so nothing can recreate
        // the file once it is gone.
        if (!keep)
            removedPartial = disk_.remove(entry->task.partialPath);
        finished = entry->task;
        stats_.record(finished);
    }
    spdlog::info("Cancelled download {} ({} bytes transferred{})", finished.id,
                 finished.bytesTransferred, removedPartial ? ", partial removed" : "");
    return true;
}

std::vector<TaskSnapshot> Scheduler::getActiveTasks() const {
    return store_.snapshots([](const DownloadTask& t) { return isActive(t.state); });
}

std::size_t Scheduler::pendingAdmissions() const {
    std::lock_guard lk(queueMutex_);
    return queue_.size();
}

void Scheduler::workerLoop(std::size_t index) {
    spdlog::debug("Download worker {} started", index);
    for (;;) {
        TaskEntryPtr entry;
        {
            std::unique_lock lk(queueMutex_);
            queueCv_.wait(lk, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_)
                break;
            entry = std::move(queue_.front());
            queue_.pop_front();
        }
        admit(entry);
    }
    spdlog::debug("Download worker {} exiting", index);
}

void Scheduler::admit(const TaskEntryPtr& entry) {
    std::uint64_t epoch = 0;
    {
        std::lock_guard el(entry->mutex);
        if (entry->task.state != TaskState::Queued)
            return; // cancelled while waiting
        {
            std::lock_guard lk(queueMutex_);
            if (stopping_) {
                queue_.push_front(entry);
                return;
            }
        }
        if (!entry->transitionLocked(TaskState::Downloading))
            return;
        epoch = entry->epoch.load(std::memory_order_acquire);
    }

    try {
        const auto outcome = executor_.run(entry, epoch);
        spdlog::debug("Download admission {} ended: {}", epoch,
                      outcome == RunOutcome::Completed ? "completed"
                      : outcome == RunOutcome::Failed  ? "failed"
                                                       : "stopped");
    } catch (const std::exception& ex) {
        // Keep the worker alive; the task must not stay Downloading forever.
        {
            std::lock_guard el(entry->mutex);
            if (entry->task.state == TaskState::Downloading &&
                entry->epoch.load(std::memory_order_acquire) == epoch &&
                entry->transitionLocked(TaskState::Failed)) {
                entry->task.lastError = std::string("Internal error: ") + ex.what();
                stats_.record(entry->task);
            }
        }
        spdlog::error("Download worker caught exception: {}", ex.what());
    }
}

} // namespace modelfetch::downloader
