#pragma once

#include <modelfetch/downloader/scheduler.hpp>
#include <modelfetch/downloader/task_store.hpp>

#include <chrono>
#include <optional>
#include <vector>

namespace modelfetch::downloader {

/**
 * Fans a list of requests out into independent tasks and collects their outcomes in input
 * order. One request failing (at enqueue or during transfer) never affects its siblings.
 */
class BatchCoordinator {
public:
    BatchCoordinator(Scheduler& scheduler, TaskStore& store)
        : scheduler_(scheduler), store_(store) {}

    /**
     * Blocks until every created task is terminal. A task left Paused keeps the batch
     * waiting until someone resumes or cancels it, unless the scheduler stops: then the
     * unfinished items report their current state with a shutdown error.
     */
    std::vector<BatchOutcome> downloadBatch(const std::vector<DownloadRequest>& requests);

    /**
     * Wait for a task to reach a terminal state. Returns the final snapshot, or the current
     * one when the timeout expires or the scheduler stops first.
     */
    TaskSnapshot waitForTerminal(const TaskEntryPtr& entry,
                                 std::optional<std::chrono::milliseconds> timeout) const;

    static BatchOutcome toOutcome(const TaskSnapshot& snapshot);

private:
    Scheduler& scheduler_;
    TaskStore& store_;
};

} // namespace modelfetch::downloader
