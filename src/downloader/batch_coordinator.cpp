#include <modelfetch/downloader/batch_coordinator.hpp>

#include <spdlog/spdlog.h>

#include <mutex>

namespace modelfetch::downloader {

TaskSnapshot
BatchCoordinator::waitForTerminal(const TaskEntryPtr& entry,
                                  std::optional<std::chrono::milliseconds> timeout) const {
    std::unique_lock lk(entry->mutex);
    // Scheduler::stop notifies every entry after closing admission.
    const auto done = [&] {
        return isTerminal(entry->task.state) || !scheduler_.isAccepting();
    };
    if (timeout) {
        entry->changed.wait_for(lk, *timeout, done);
    } else {
        entry->changed.wait(lk, done);
    }
    return makeSnapshot(entry->task);
}

BatchOutcome BatchCoordinator::toOutcome(const TaskSnapshot& snapshot) {
    BatchOutcome out;
    out.taskId = snapshot.id;
    out.state = snapshot.state;
    out.error = snapshot.lastError;
    out.fileSize = snapshot.bytesTransferred;
    out.checksum = snapshot.checksum;
    if (snapshot.state == TaskState::Completed)
        out.filePath = snapshot.destinationPath;
    const auto end = snapshot.completedAt.value_or(snapshot.updatedAt);
    if (end > snapshot.createdAt) {
        out.duration =
            std::chrono::duration_cast<std::chrono::milliseconds>(end - snapshot.createdAt);
    }
    return out;
}

std::vector<BatchOutcome>
BatchCoordinator::downloadBatch(const std::vector<DownloadRequest>& requests) {
    std::vector<BatchOutcome> outcomes(requests.size());
    if (requests.empty())
        return outcomes;

    std::vector<TaskEntryPtr> entries(requests.size());
    for (std::size_t i = 0; i < requests.size(); ++i) {
        auto queued = scheduler_.enqueue(requests[i]);
        if (!queued) {
            outcomes[i].state = TaskState::Failed;
            outcomes[i].error = queued.error().message;
            spdlog::warn("Batch item {} rejected: {}", i, queued.error().message);
            continue;
        }
        entries[i] = store_.find(queued.value());
        outcomes[i].taskId = queued.value();
    }

    std::size_t completed = 0;
    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (!entries[i])
            continue;
        outcomes[i] = toOutcome(waitForTerminal(entries[i], std::nullopt));
        if (!isTerminal(outcomes[i].state)) {
            outcomes[i].error = "Download manager shut down";
            spdlog::warn("Batch item {} left {} by shutdown", i, toString(outcomes[i].state));
        }
        if (outcomes[i].state == TaskState::Completed)
            ++completed;
    }
    spdlog::info("Batch finished: {}/{} completed", completed, requests.size());
    return outcomes;
}

} // namespace modelfetch::downloader
