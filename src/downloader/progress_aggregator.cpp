#include <modelfetch/downloader/progress_aggregator.hpp>

#include <cmath>

namespace modelfetch::downloader {

ProgressSnapshot ProgressAggregator::compute(const DownloadTask& task,
                                             const std::deque<RateSample>& samples,
                                             std::chrono::steady_clock::time_point now,
                                             std::chrono::milliseconds window) {
    ProgressSnapshot out;
    out.state = task.state;
    out.bytesTransferred = task.bytesTransferred;
    out.bytesTotal = task.bytesTotal;

    if (task.bytesTotal) {
        if (*task.bytesTotal > 0) {
            out.percentComplete = (static_cast<double>(task.bytesTransferred) * 100.0) /
                                  static_cast<double>(*task.bytesTotal);
        } else {
            out.percentComplete = task.state == TaskState::Completed ? 100.0 : 0.0;
        }
    }

    if (task.state != TaskState::Downloading || samples.empty()) {
        return out;
    }

    // Baseline: the newest sample older than the window start, else the oldest sample. The
    // rate runs to `now`, so a stalled transfer decays toward zero instead of reporting its
    // last burst forever.
    const auto windowStart = now - window;
    const RateSample* baseline = nullptr;
    for (const auto& s : samples) {
        if (s.at >= windowStart) {
            if (!baseline)
                baseline = &s;
            break;
        }
        baseline = &s;
    }
    if (!baseline)
        baseline = &samples.front();

    const auto& latest = samples.back();
    const double elapsed = std::chrono::duration<double>(now - baseline->at).count();
    if (elapsed <= 0.0 || latest.bytesTransferred <= baseline->bytesTransferred) {
        return out;
    }
    out.currentSpeed =
        static_cast<double>(latest.bytesTransferred - baseline->bytesTransferred) / elapsed;

    if (task.bytesTotal && out.currentSpeed > 0.0) {
        const auto remaining = *task.bytesTotal > task.bytesTransferred
                                   ? *task.bytesTotal - task.bytesTransferred
                                   : std::uint64_t{0};
        out.estimatedTimeRemaining = std::chrono::seconds(
            static_cast<long long>(std::ceil(static_cast<double>(remaining) / out.currentSpeed)));
    }
    return out;
}

std::optional<ProgressSnapshot> ProgressAggregator::getDownloadProgress(std::string_view id) const {
    auto entry = store_.find(id);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard lk(entry->mutex);
    return compute(entry->task, entry->samples, std::chrono::steady_clock::now(), window_);
}

} // namespace modelfetch::downloader
