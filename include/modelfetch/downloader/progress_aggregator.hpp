#pragma once

#include <modelfetch/downloader/task_store.hpp>

#include <chrono>
#include <optional>
#include <string_view>

namespace modelfetch::downloader {

/**
 * Derives progress snapshots from task records on read. Holds no state of its own besides
 * the window width; the samples it reads are appended by the executor on each commit.
 */
class ProgressAggregator {
public:
    explicit ProgressAggregator(const TaskStore& store,
                                std::chrono::milliseconds window = std::chrono::seconds(5))
        : store_(store), window_(window) {}

    [[nodiscard]] std::optional<ProgressSnapshot> getDownloadProgress(std::string_view id) const;

    /**
     * Pure computation over one record; caller holds the entry lock.
     */
    static ProgressSnapshot compute(const DownloadTask& task, const std::deque<RateSample>& samples,
                                    std::chrono::steady_clock::time_point now,
                                    std::chrono::milliseconds window);

private:
    const TaskStore& store_;
    std::chrono::milliseconds window_;
};

} // namespace modelfetch::downloader
