#include <modelfetch/downloader/statistics_accumulator.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace modelfetch::downloader {

double StatisticsAccumulator::achievedSpeed(std::uint64_t bytes,
                                            std::chrono::steady_clock::duration active) {
    // Sub-millisecond transfers (local mirrors, tests) are clamped to 1 ms.
    const auto seconds =
        std::max(std::chrono::duration<double>(active).count(), 0.001);
    return static_cast<double>(bytes) / seconds;
}

void StatisticsAccumulator::record(const DownloadTask& task) {
    if (!isTerminal(task.state))
        return;

    std::lock_guard lk(mutex_);
    ++stats_.totalDownloads;
    switch (task.state) {
        case TaskState::Completed: {
            const auto previous = static_cast<double>(stats_.successfulDownloads);
            ++stats_.successfulDownloads;
            stats_.totalBytesDownloaded += task.bytesTransferred;
            const double speed = achievedSpeed(task.bytesTransferred, task.activeDuration);
            stats_.averageSpeed = (stats_.averageSpeed * previous + speed) /
                                  static_cast<double>(stats_.successfulDownloads);
            break;
        }
        case TaskState::Failed:
            ++stats_.failedDownloads;
            break;
        default:
            break;
    }
    spdlog::debug("Statistics: total={} ok={} failed={} bytes={} avg={:.0f} B/s",
                  stats_.totalDownloads, stats_.successfulDownloads, stats_.failedDownloads,
                  stats_.totalBytesDownloaded, stats_.averageSpeed);
}

DownloadStatistics StatisticsAccumulator::snapshot() const {
    std::lock_guard lk(mutex_);
    return stats_;
}

void StatisticsAccumulator::reset() {
    std::lock_guard lk(mutex_);
    stats_ = DownloadStatistics{};
}

} // namespace modelfetch::downloader
