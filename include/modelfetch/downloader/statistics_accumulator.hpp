#pragma once

#include <modelfetch/downloader/download_task.hpp>

#include <chrono>
#include <mutex>

namespace modelfetch::downloader {

/**
 * Process-wide download totals. Single writer semantics: every update is applied under
 * one mutex so concurrent terminal transitions never interleave.
 */
class StatisticsAccumulator {
public:
    /**
     * Account for one task that just reached a terminal state. Non-terminal states are
     * ignored.
     */
    void record(const DownloadTask& task);

    [[nodiscard]] DownloadStatistics snapshot() const;

    void reset();

    /**
     * Achieved speed of a task over its accumulated active time (bytes/sec).
     */
    static double achievedSpeed(std::uint64_t bytes, std::chrono::steady_clock::duration active);

private:
    mutable std::mutex mutex_;
    DownloadStatistics stats_{};
};

} // namespace modelfetch::downloader
