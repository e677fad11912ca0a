/*
 * modelfetch/src/downloader/transfer_executor.cpp
 *
 * Single-task transfer:
 * - Open the partial artifact at resumeOffset (truncating anything uncommitted)
 * - Probe for the content length when the registry did not supply one
 * - Stream one range request from resumeOffset, buffering into chunk-sized commits
 * - Retry transient failures with exponential backoff, continuing from the last commit
 * - Verify the checksum (when requested) and atomically move the artifact into place
 */

#include <modelfetch/downloader/transfer_executor.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace modelfetch::downloader {

namespace {

constexpr std::size_t kMaxRateSamples = 256;
constexpr auto kRateSampleRetention = std::chrono::seconds(30);

// Caller holds entry.mutex.
bool ownedLocked(const TaskEntry& entry, std::uint64_t epoch) {
    return entry.task.state == TaskState::Downloading &&
           entry.epoch.load(std::memory_order_acquire) == epoch;
}

void pushSampleLocked(TaskEntry& entry, std::chrono::steady_clock::time_point now) {
    entry.samples.push_back(RateSample{now, entry.task.bytesTransferred});
    while (entry.samples.size() > kMaxRateSamples ||
           (entry.samples.size() > 2 && now - entry.samples.front().at > kRateSampleRetention)) {
        entry.samples.pop_front();
    }
}

} // namespace

TransferExecutor::TransferExecutor(ExecutorConfig config, IHttpAdapter& http, IDiskWriter& disk,
                                   TerminalCallback onTerminal)
    : config_(std::move(config)), http_(http), disk_(disk), onTerminal_(std::move(onTerminal)) {
    if (config_.chunkSizeBytes == 0)
        config_.chunkSizeBytes = 64 * 1024;
}

std::chrono::milliseconds TransferExecutor::backoffFor(const RetryPolicy& policy, int retry) {
    const double factor = std::pow(std::max(policy.multiplier, 1.0), std::max(retry - 1, 0));
    const double ms = static_cast<double>(policy.initialBackoff.count()) * factor;
    const double capped = std::min(ms, static_cast<double>(policy.maxBackoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::max(capped, 0.0)));
}

RunOutcome TransferExecutor::run(const TaskEntryPtr& entry, std::uint64_t epoch) {
    std::string id;
    RetryPolicy retry;
    {
        std::lock_guard lk(entry->mutex);
        if (!ownedLocked(*entry, epoch))
            return RunOutcome::Stopped;
        id = entry->task.id;
        retry = entry->task.retry;
        spdlog::info("Transfer {}: starting {} at offset {} (attempt {})", id,
                     entry->task.sourceRef, entry->task.resumeOffset, entry->task.attempt);
    }

    const auto stopped = [&] {
        return entry->stopRequested.load(std::memory_order_acquire) ||
               entry->epoch.load(std::memory_order_acquire) != epoch;
    };

    for (;;) {
        Expected<void> r = Error{ErrorCode::Unknown, "transfer did not run"};
        try {
            r = attemptOnce(entry, epoch);
        } catch (const std::exception& ex) {
            r = Error{ErrorCode::Unknown, std::string("Exception: ") + ex.what()};
        }

        if (r.ok())
            return complete(entry, epoch);

        const auto& err = r.error();
        if (err.code == ErrorCode::Cancelled || stopped()) {
            spdlog::debug("Transfer {}: stopped ({})", id, err.message);
            return RunOutcome::Stopped;
        }

        int attemptNo = 0;
        {
            std::lock_guard lk(entry->mutex);
            if (!ownedLocked(*entry, epoch))
                return RunOutcome::Stopped;
            if (!isTransient(err.code) || entry->task.attempt + 1 >= retry.maxAttempts) {
                attemptNo = -1;
            } else {
                attemptNo = ++entry->task.attempt;
                entry->task.updatedAt = std::chrono::system_clock::now();
            }
        }
        if (attemptNo < 0)
            return fail(entry, epoch, err);

        const auto delay = backoffFor(retry, attemptNo);
        spdlog::warn("Transfer {}: {} ({}); retry {}/{} in {} ms", id, err.message,
                     toString(err.code), attemptNo, retry.maxAttempts - 1, delay.count());
        if (!waitBackoff(entry, epoch, delay))
            return RunOutcome::Stopped;
    }
}

Expected<void> TransferExecutor::attemptOnce(const TaskEntryPtr& entry, std::uint64_t epoch) {
    std::string url;
    std::filesystem::path partial;
    FetchOptions options;
    std::uint64_t offset = 0;
    std::optional<std::uint64_t> total;
    {
        std::lock_guard lk(entry->mutex);
        if (!ownedLocked(*entry, epoch))
            return Error{ErrorCode::Cancelled, "task no longer owned by this transfer"};
        url = entry->task.sourceRef;
        partial = entry->task.partialPath;
        options = entry->task.fetch;
        offset = entry->task.bytesTransferred;
        total = entry->task.bytesTotal;

        // Under the lock so a cancel that already removed the partial cannot race a re-create.
        auto opened = disk_.openForResume(partial, offset);
        if (!opened.ok())
            return opened.error();
    }

    if (!total) {
        auto probe = http_.probe(url, options);
        if (!probe.ok())
            return probe.error();
        if (probe.value().contentLength) {
            total = probe.value().contentLength;
            std::lock_guard lk(entry->mutex);
            if (!ownedLocked(*entry, epoch))
                return Error{ErrorCode::Cancelled, "task no longer owned by this transfer"};
            if (*total < entry->task.bytesTransferred) {
                return Error{ErrorCode::PolicyViolation,
                             "source shrank below the bytes already transferred"};
            }
            entry->task.bytesTotal = total;
        }
    }

    if (config_.maxFileBytes > 0 && total && *total > config_.maxFileBytes) {
        return Error{ErrorCode::PolicyViolation, "Object exceeds configured max_file_bytes (" +
                                                     std::to_string(config_.maxFileBytes) + ")"};
    }

    const auto stopped = [&] {
        return entry->stopRequested.load(std::memory_order_acquire) ||
               entry->epoch.load(std::memory_order_acquire) != epoch;
    };

    std::vector<std::byte> buffer;
    buffer.reserve(config_.chunkSizeBytes);
    auto lastCommit = std::chrono::steady_clock::now();
    std::optional<Error> commitError;

    auto commit = [&]() -> Expected<void> {
        if (buffer.empty())
            return Expected<void>{};
        std::lock_guard lk(entry->mutex);
        if (!ownedLocked(*entry, epoch))
            return Error{ErrorCode::Cancelled, "task no longer owned by this transfer"};

        auto& task = entry->task;
        const auto end = task.bytesTransferred + static_cast<std::uint64_t>(buffer.size());
        if (task.bytesTotal && end > *task.bytesTotal) {
            return Error{ErrorCode::PolicyViolation,
                         "server sent more than the expected " +
                             std::to_string(*task.bytesTotal) + " bytes"};
        }
        if (config_.maxFileBytes > 0 && end > config_.maxFileBytes) {
            return Error{ErrorCode::PolicyViolation,
                         "Exceeded configured max_file_bytes during download"};
        }
        auto wr = disk_.writeAt(partial, task.bytesTransferred, buffer);
        if (!wr.ok())
            return wr.error();

        const auto now = std::chrono::steady_clock::now();
        task.bytesTransferred = end;
        task.updatedAt = std::chrono::system_clock::now();
        pushSampleLocked(*entry, now);
        buffer.clear();
        lastCommit = now;
        return Expected<void>{};
    };

    auto sink = [&](std::span<const std::byte> data) -> Expected<void> {
        if (stopped())
            return Error{ErrorCode::Cancelled, "stop requested"};
        buffer.insert(buffer.end(), data.begin(), data.end());
        if (buffer.size() >= config_.chunkSizeBytes ||
            std::chrono::steady_clock::now() - lastCommit >= config_.progressInterval) {
            auto c = commit();
            if (!c.ok()) {
                commitError = c.error();
                return c;
            }
        }
        return Expected<void>{};
    };

    if (!total || offset < *total) {
        const std::uint64_t size = total ? (*total - offset) : 0; // 0 => open-ended
        auto fr = http_.fetchRange(url, options, offset, size, sink, stopped);
        if (commitError)
            return *commitError;
        if (!fr.ok()) {
            // Keep whatever arrived intact before a network failure; drop it on stop.
            if (!stopped() && fr.error().code != ErrorCode::ResumeNotSupported) {
                auto c = commit();
                if (!c.ok())
                    return c.error();
            }
            return fr.error();
        }
        auto c = commit();
        if (!c.ok())
            return c.error();
    }

    std::lock_guard lk(entry->mutex);
    if (!ownedLocked(*entry, epoch))
        return Error{ErrorCode::Cancelled, "task no longer owned by this transfer"};
    auto& task = entry->task;
    if (task.bytesTotal && task.bytesTransferred != *task.bytesTotal) {
        return Error{ErrorCode::NetworkError,
                     "transfer ended early at " + std::to_string(task.bytesTransferred) + " of " +
                         std::to_string(*task.bytesTotal) + " bytes"};
    }
    if (!task.bytesTotal)
        task.bytesTotal = task.bytesTransferred;
    return Expected<void>{};
}

RunOutcome TransferExecutor::complete(const TaskEntryPtr& entry, std::uint64_t epoch) {
    std::filesystem::path partial;
    std::filesystem::path destination;
    std::optional<Checksum> expected;
    {
        std::lock_guard lk(entry->mutex);
        if (!ownedLocked(*entry, epoch))
            return RunOutcome::Stopped;
        partial = entry->task.partialPath;
        destination = entry->task.destinationPath;
        expected = entry->task.expectedChecksum;
    }

    if (config_.fsyncOnComplete) {
        auto sr = disk_.sync(partial);
        if (!sr.ok())
            return fail(entry, epoch, sr.error());
    }

    const auto algo = expected ? expected->algo : HashAlgo::Sha256;
    auto digest = computeFileChecksum(partial, algo);
    if (!digest) {
        return fail(entry, epoch, Error{ErrorCode::IoError, "Failed to hash " + partial.string()});
    }
    if (expected && expected->hex != digest->hex) {
        // A corrupt artifact cannot be resumed into a good one; drop it.
        return fail(entry, epoch,
                    Error{ErrorCode::ChecksumMismatch, "Checksum mismatch (expected " +
                                                           expected->hex + ", got " + digest->hex +
                                                           ")"},
                    true);
    }

    DownloadTask finished;
    {
        std::lock_guard lk(entry->mutex);
        if (!ownedLocked(*entry, epoch))
            return RunOutcome::Stopped;
        auto fr = disk_.finalize(partial, destination);
        if (!fr.ok()) {
            entry->transitionLocked(TaskState::Failed);
            entry->task.lastError = fr.error().message;
        } else {
            entry->task.checksum = formatChecksum(*digest);
            entry->transitionLocked(TaskState::Completed);
        }
        finished = entry->task;
        // Still under the entry lock: waiters see the totals updated with the state.
        if (onTerminal_)
            onTerminal_(finished);
    }

    if (finished.state == TaskState::Completed) {
        spdlog::info("Transfer {}: completed {} bytes -> {}", finished.id,
                     finished.bytesTransferred, finished.destinationPath.string());
    } else {
        spdlog::warn("Transfer {}: failed to finalize: {}", finished.id,
                     finished.lastError.value_or(""));
    }
    return finished.state == TaskState::Completed ? RunOutcome::Completed : RunOutcome::Failed;
}

RunOutcome TransferExecutor::fail(const TaskEntryPtr& entry, std::uint64_t epoch,
                                  const Error& error, bool discardPartial) {
    DownloadTask finished;
    {
        std::lock_guard lk(entry->mutex);
        if (!ownedLocked(*entry, epoch))
            return RunOutcome::Stopped;
        if (!entry->transitionLocked(TaskState::Failed))
            return RunOutcome::Stopped;
        if (discardPartial && disk_.remove(entry->task.partialPath))
            spdlog::debug("Transfer {}: removed {}", entry->task.id,
                          entry->task.partialPath.string());
        entry->task.lastError = error.message.empty() ? std::string(toString(error.code))
                                                      : error.message;
        finished = entry->task;
        if (onTerminal_)
            onTerminal_(finished);
    }
    spdlog::warn("Transfer {}: failed after {} attempt(s): {}", finished.id, finished.attempt + 1,
                 finished.lastError.value_or(""));
    return RunOutcome::Failed;
}

bool TransferExecutor::waitBackoff(const TaskEntryPtr& entry, std::uint64_t epoch,
                                   std::chrono::milliseconds delay) {
    std::unique_lock lk(entry->mutex);
    entry->changed.wait_for(lk, delay, [&] { return !ownedLocked(*entry, epoch); });
    return ownedLocked(*entry, epoch);
}

} // namespace modelfetch::downloader
