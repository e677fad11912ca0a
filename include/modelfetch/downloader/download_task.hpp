#pragma once

#include <modelfetch/core/types.h>
#include <modelfetch/downloader/downloader.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modelfetch::downloader {

/**
 * Lifecycle of a download task.
 *
 *   Queued ──► Downloading ──► Completed
 *     │  ▲         │  │  └───► Failed
 *     │  │         │  └──────► Cancelled
 *     │  └─ Paused ◄┘
 *     └──────────────────────► Cancelled
 *
 * Completed, Failed and Cancelled are terminal.
 */
enum class TaskState : std::uint8_t { Queued, Downloading, Paused, Completed, Failed, Cancelled };

constexpr const char* toString(TaskState state) {
    switch (state) {
        case TaskState::Queued: return "queued";
        case TaskState::Downloading: return "downloading";
        case TaskState::Paused: return "paused";
        case TaskState::Completed: return "completed";
        case TaskState::Failed: return "failed";
        case TaskState::Cancelled: return "cancelled";
    }
    return "unknown";
}

constexpr bool isTerminal(TaskState state) {
    return state == TaskState::Completed || state == TaskState::Failed ||
           state == TaskState::Cancelled;
}

constexpr bool isActive(TaskState state) {
    return state == TaskState::Queued || state == TaskState::Downloading;
}

constexpr bool canTransition(TaskState from, TaskState to) {
    switch (from) {
        case TaskState::Queued:
            return to == TaskState::Downloading || to == TaskState::Cancelled;
        case TaskState::Downloading:
            return to == TaskState::Paused || to == TaskState::Completed ||
                   to == TaskState::Failed || to == TaskState::Cancelled;
        case TaskState::Paused:
            return to == TaskState::Queued || to == TaskState::Cancelled;
        case TaskState::Completed:
        case TaskState::Failed:
        case TaskState::Cancelled:
            return false;
    }
    return false;
}

/**
 * A caller-facing download request. sourceRef and destinationPath are required; the rest
 * comes from the registry collaborator or overrides manager defaults.
 */
struct DownloadRequest {
    std::string sourceRef;
    std::filesystem::path destinationPath;

    std::optional<std::uint64_t> expectedBytes;
    std::optional<std::string> checksum; // "<algo>:<hex>"
    std::vector<Header> headers;

    std::optional<std::chrono::milliseconds> timeout;
    std::optional<RetryPolicy> retry;
    std::optional<bool> keepPartialOnCancel;
};

/**
 * Authoritative task record held by the TaskStore.
 */
struct DownloadTask {
    TaskId id;
    std::uint64_t sequence{0}; // creation order within the store
    std::string sourceRef;
    std::filesystem::path destinationPath;
    std::filesystem::path partialPath;

    TaskState state{TaskState::Queued};
    std::optional<std::uint64_t> bytesTotal;
    std::uint64_t bytesTransferred{0};
    std::uint64_t resumeOffset{0};
    int attempt{0};
    std::optional<std::string> lastError;

    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt;

    std::optional<Checksum> expectedChecksum;
    std::optional<std::string> checksum; // "<algo>:<hex>" once completed
    FetchOptions fetch;
    RetryPolicy retry;
    std::optional<bool> keepPartialOnCancel;

    std::chrono::steady_clock::duration activeDuration{};
};

/**
 * Immutable copy of a task record handed to callers.
 */
struct TaskSnapshot {
    TaskId id;
    std::string sourceRef;
    std::filesystem::path destinationPath;
    TaskState state{TaskState::Queued};
    std::optional<std::uint64_t> bytesTotal;
    std::uint64_t bytesTransferred{0};
    std::uint64_t resumeOffset{0};
    int attempt{0};
    std::optional<std::string> lastError;
    TimePoint createdAt{};
    TimePoint updatedAt{};
    std::optional<TimePoint> completedAt;
    std::optional<std::string> checksum;
};

struct ProgressSnapshot {
    TaskState state{TaskState::Queued};
    std::uint64_t bytesTransferred{0};
    std::optional<std::uint64_t> bytesTotal;
    std::optional<double> percentComplete;            // 0.0 - 100.0
    double currentSpeed{0.0};                          // bytes/sec over the sample window
    std::optional<std::chrono::seconds> estimatedTimeRemaining;
};

struct DownloadStatistics {
    std::uint64_t totalDownloads{0};
    std::uint64_t successfulDownloads{0};
    std::uint64_t failedDownloads{0};
    std::uint64_t totalBytesDownloaded{0};
    double averageSpeed{0.0}; // bytes/sec, mean over completed downloads
};

/**
 * Per-request outcome of a batch, in request order.
 */
struct BatchOutcome {
    TaskId taskId; // empty when the request was rejected before a task existed
    TaskState state{TaskState::Failed};
    std::optional<std::string> error;
    std::filesystem::path filePath;
    std::uint64_t fileSize{0};
    std::chrono::milliseconds duration{0};
    std::optional<std::string> checksum;
};

/**
 * Result of a synchronous downloadModel() call.
 */
struct DownloadResult {
    bool success{false};
    TaskId taskId;
    std::filesystem::path filePath;
    std::uint64_t fileSize{0};
    std::chrono::milliseconds duration{0};
    std::optional<std::string> checksum;
    std::optional<std::string> error;
};

TaskSnapshot makeSnapshot(const DownloadTask& task);

} // namespace modelfetch::downloader
