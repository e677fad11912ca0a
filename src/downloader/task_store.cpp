/*
 * modelfetch/src/downloader/task_store.cpp
 *
 * In-memory task store.
 *
 * - shared_mutex over the id map, one mutex per record
 * - state changes go through TaskEntry::transitionLocked, which rejects illegal
 *   transitions (e.g. Completed -> Downloading) and maintains resumeOffset
 */

#include <modelfetch/downloader/task_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace modelfetch::downloader {

namespace {

bool sameDestination(const std::filesystem::path& a, const std::filesystem::path& b) {
    return a.lexically_normal() == b.lexically_normal();
}

} // namespace

TaskSnapshot makeSnapshot(const DownloadTask& task) {
    TaskSnapshot s;
    s.id = task.id;
    s.sourceRef = task.sourceRef;
    s.destinationPath = task.destinationPath;
    s.state = task.state;
    s.bytesTotal = task.bytesTotal;
    s.bytesTransferred = task.bytesTransferred;
    s.resumeOffset = task.resumeOffset;
    s.attempt = task.attempt;
    s.lastError = task.lastError;
    s.createdAt = task.createdAt;
    s.updatedAt = task.updatedAt;
    s.completedAt = task.completedAt;
    s.checksum = task.checksum;
    return s;
}

bool TaskEntry::transitionLocked(TaskState to) {
    const auto from = task.state;
    if (!canTransition(from, to)) {
        spdlog::debug("Task {}: rejected transition {} -> {}", task.id, toString(from),
                      toString(to));
        return false;
    }

    const auto steadyNow = std::chrono::steady_clock::now();
    if (from == TaskState::Downloading) {
        if (runningSince) {
            task.activeDuration += steadyNow - *runningSince;
            runningSince.reset();
        }
        samples.clear();
        if (to != TaskState::Completed) {
            task.resumeOffset = task.bytesTransferred;
        }
    }
    if (to == TaskState::Downloading) {
        runningSince = steadyNow;
        samples.clear();
        samples.push_back(RateSample{steadyNow, task.bytesTransferred});
        epoch.fetch_add(1, std::memory_order_acq_rel);
        stopRequested.store(false, std::memory_order_release);
        task.lastError.reset();
    } else if (from == TaskState::Downloading) {
        stopRequested.store(true, std::memory_order_release);
    }

    const auto now = std::chrono::system_clock::now();
    task.state = to;
    task.updatedAt = now;
    if (to == TaskState::Completed) {
        task.completedAt = now;
    }
    if (to != TaskState::Failed) {
        task.lastError.reset();
    }

    spdlog::debug("Task {}: {} -> {} ({} bytes)", task.id, toString(from), toString(to),
                  task.bytesTransferred);
    changed.notify_all();
    return true;
}

TaskEntryPtr TaskStore::tryInsert(DownloadTask task, bool requireFreeDestination) {
    std::unique_lock lk(mutex_);
    if (tasks_.count(task.id) != 0) {
        return nullptr;
    }
    if (requireFreeDestination) {
        for (const auto& [id, entry] : tasks_) {
            std::lock_guard el(entry->mutex);
            if (!isTerminal(entry->task.state) &&
                sameDestination(entry->task.destinationPath, task.destinationPath)) {
                return nullptr;
            }
        }
    }
    task.sequence = nextSequence_++;
    auto entry = std::make_shared<TaskEntry>(std::move(task));
    tasks_.emplace(entry->task.id, entry);
    return entry;
}

TaskEntryPtr TaskStore::find(std::string_view id) const {
    std::shared_lock lk(mutex_);
    auto it = tasks_.find(std::string(id));
    if (it == tasks_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<TaskEntryPtr> TaskStore::entries() const {
    std::vector<TaskEntryPtr> out;
    {
        std::shared_lock lk(mutex_);
        out.reserve(tasks_.size());
        for (const auto& [id, entry] : tasks_) {
            out.push_back(entry);
        }
    }
    // sequence is immutable after insert, safe to read without the entry lock
    std::sort(out.begin(), out.end(), [](const TaskEntryPtr& a, const TaskEntryPtr& b) {
        return a->task.sequence < b->task.sequence;
    });
    return out;
}

std::vector<TaskSnapshot>
TaskStore::snapshots(const std::function<bool(const DownloadTask&)>& pred) const {
    std::vector<TaskSnapshot> out;
    for (const auto& entry : entries()) {
        std::lock_guard el(entry->mutex);
        if (!pred || pred(entry->task)) {
            out.push_back(makeSnapshot(entry->task));
        }
    }
    return out;
}

std::vector<DownloadTask>
TaskStore::eraseIf(const std::function<bool(const DownloadTask&)>& pred) {
    std::vector<DownloadTask> removed;
    std::unique_lock lk(mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        bool match = false;
        {
            std::lock_guard el(it->second->mutex);
            match = pred(it->second->task);
            if (match) {
                removed.push_back(it->second->task);
            }
        }
        if (match) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(removed.begin(), removed.end(),
              [](const DownloadTask& a, const DownloadTask& b) { return a.sequence < b.sequence; });
    return removed;
}

bool TaskStore::destinationInUse(const std::filesystem::path& destination,
                                 std::string_view excludeId) const {
    std::shared_lock lk(mutex_);
    for (const auto& [id, entry] : tasks_) {
        if (id == excludeId) {
            continue;
        }
        std::lock_guard el(entry->mutex);
        if (!isTerminal(entry->task.state) &&
            sameDestination(entry->task.destinationPath, destination)) {
            return true;
        }
    }
    return false;
}

std::size_t TaskStore::size() const {
    std::shared_lock lk(mutex_);
    return tasks_.size();
}

} // namespace modelfetch::downloader
