#pragma once

#include <modelfetch/downloader/downloader.hpp>
#include <modelfetch/downloader/task_store.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace modelfetch::downloader {

struct ExecutorConfig {
    // Bytes buffered before a commit to disk and the task record.
    std::size_t chunkSizeBytes{1024ull * 1024ull};
    // Commit at least this often even when the chunk is not full.
    std::chrono::milliseconds progressInterval{250};
    std::uint64_t maxFileBytes{0}; // 0 = unlimited
    bool fsyncOnComplete{true};
};

/**
 * How one admission of a task ended.
 */
enum class RunOutcome {
    Completed,
    Failed,
    Stopped // pause, cancel or re-admission observed; whoever stopped us owns the state
};

/**
 * Runs a single admission of a task: range fetch from resumeOffset into the partial
 * artifact, chunked commits, retry with exponential backoff, verification and finalize.
 *
 * The executor only ever writes while it holds the task's mutex and the task is still
 * Downloading under the epoch it was admitted with, so a stale executor can never touch
 * the artifact after pause, cancel or a newer admission.
 */
class TransferExecutor {
public:
    // Invoked with the task's mutex held; must not call back into the TaskStore.
    using TerminalCallback = std::function<void(const DownloadTask&)>;

    TransferExecutor(ExecutorConfig config, IHttpAdapter& http, IDiskWriter& disk,
                     TerminalCallback onTerminal = {});

    RunOutcome run(const TaskEntryPtr& entry, std::uint64_t epoch);

    static std::chrono::milliseconds backoffFor(const RetryPolicy& policy, int retry);

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

private:
    Expected<void> attemptOnce(const TaskEntryPtr& entry, std::uint64_t epoch);
    RunOutcome complete(const TaskEntryPtr& entry, std::uint64_t epoch);
    // discardPartial removes the partial artifact once the failure is committed.
    RunOutcome fail(const TaskEntryPtr& entry, std::uint64_t epoch, const Error& error,
                    bool discardPartial = false);
    bool waitBackoff(const TaskEntryPtr& entry, std::uint64_t epoch,
                     std::chrono::milliseconds delay);

    ExecutorConfig config_;
    IHttpAdapter& http_;
    IDiskWriter& disk_;
    TerminalCallback onTerminal_;
};

} // namespace modelfetch::downloader
