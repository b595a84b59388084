#include "offcache/runtime/background_processor.h"

#include <algorithm>

#include "offcache/common/logger.h"
#include "offcache/core/error.h"

namespace offcache {
namespace runtime {

BackgroundProcessor::BackgroundProcessor(const BackgroundProcessorConfig& config)
    : config_(config) {
}

BackgroundProcessor::~BackgroundProcessor() {
    shutdown();
}

core::Result<void> BackgroundProcessor::initialize() {
    if (running_.load() || !workers_.empty()) {
        return core::Result<void>::error("BackgroundProcessor already initialized",
                                         core::Error::Code::ALREADY_EXISTS);
    }
    if (config_.num_workers == 0) {
        return core::Result<void>::error("Invalid number of workers: 0", core::Error::Code::INVALID_ARGUMENT);
    }
    if (config_.max_queue_size == 0) {
        return core::Result<void>::error("Invalid max queue size: 0", core::Error::Code::INVALID_ARGUMENT);
    }

    stopping_.store(false);
    fetch_only_workers_ = std::min(config_.reserved_fetch_workers, config_.num_workers - 1);
    workers_.reserve(config_.num_workers);
    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&BackgroundProcessor::workerLoop, this, i < fetch_only_workers_);
    }
    running_.store(true);
    OFFCACHE_DEBUG("BackgroundProcessor started with {} workers ({} reserved for fetches)",
                   config_.num_workers, fetch_only_workers_);
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::shutdown() {
    if (workers_.empty()) {
        return core::Result<void>();
    }

    // Queued tasks are destroyed outside the lock, their captures may be arbitrary
    std::vector<std::unique_ptr<Task>> dropped;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_.store(false);
        stopping_.store(true);
        while (!queue_.empty()) {
            dropped.push_back(std::move(const_cast<std::unique_ptr<Task>&>(queue_.top())));
            queue_.pop();
        }
    }
    queue_condition_.notify_all();
    if (!dropped.empty()) {
        dropped_.fetch_add(dropped.size());
        OFFCACHE_DEBUG("BackgroundProcessor dropping {} queued tasks at shutdown", dropped.size());
    }
    dropped.clear();
    idle_condition_.notify_all();

    joinWorkers();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::spawnDetached(BackgroundTaskType type,
                                                      TaskFunction task_func,
                                                      std::string description) {
    auto task = std::make_unique<Task>();
    task->type = type;
    task->func = std::move(task_func);
    task->description = std::move(description);
    task->enqueued_at = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load()) {
            return core::Result<void>::error("BackgroundProcessor is not running", core::Error::Code::UNAVAILABLE);
        }
        if (queue_.size() >= config_.max_queue_size) {
            rejected_.fetch_add(1);
            return core::Result<void>::error("Queue is full", core::Error::Code::RESOURCE_EXHAUSTED);
        }
        task->sequence = next_sequence_++;
        queue_.push(std::move(task));
        submitted_.fetch_add(1);
    }
    // A reserved worker may be the one woken for a task it cannot take
    queue_condition_.notify_all();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool idle = idle_condition_.wait_for(lock, timeout, [this] {
        return queue_.empty() && active_tasks_ == 0;
    });
    if (!idle) {
        return core::Result<void>::error("Wait for completion timed out", core::Error::Code::TIMEOUT);
    }
    return core::Result<void>();
}

BackgroundProcessorStatsSnapshot BackgroundProcessor::getStats() const {
    BackgroundProcessorStatsSnapshot snap;
    snap.tasks_submitted = submitted_.load();
    snap.tasks_rejected = rejected_.load();
    snap.tasks_processed = processed_.load();
    snap.tasks_failed = failed_.load();
    snap.tasks_timeout = timed_out_.load();
    snap.tasks_dropped = dropped_.load();
    snap.fetch_tasks = by_type_[static_cast<size_t>(BackgroundTaskType::FETCH)].load();
    snap.command_tasks = by_type_[static_cast<size_t>(BackgroundTaskType::COMMAND)].load();
    snap.revalidate_tasks = by_type_[static_cast<size_t>(BackgroundTaskType::REVALIDATE)].load();
    snap.queue_size = getQueueSize();
    return snap;
}

uint32_t BackgroundProcessor::getQueueSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return static_cast<uint32_t>(queue_.size());
}

void BackgroundProcessor::workerLoop(bool fetch_only) {
    while (true) {
        auto task = takeTask(fetch_only);
        if (!task) {
            if (stopping_.load()) {
                return;
            }
            continue;
        }
        runTask(*task);
        task.reset();
        finishTask();
    }
}

bool BackgroundProcessor::hasTaskFor(bool fetch_only) const {
    if (queue_.empty()) {
        return false;
    }
    // FETCH sorts first, so the top is a FETCH whenever one is queued
    return !fetch_only || queue_.top()->type == BackgroundTaskType::FETCH;
}

std::unique_ptr<BackgroundProcessor::Task> BackgroundProcessor::takeTask(bool fetch_only) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_condition_.wait_for(lock, config_.worker_wait_timeout, [this, fetch_only] {
        return hasTaskFor(fetch_only) || stopping_.load();
    });
    if (stopping_.load() || !hasTaskFor(fetch_only)) {
        return nullptr;
    }

    auto task = std::move(const_cast<std::unique_ptr<Task>&>(queue_.top()));
    queue_.pop();
    ++active_tasks_;
    return task;
}

void BackgroundProcessor::runTask(Task& task) {
    processed_.fetch_add(1);
    by_type_[static_cast<size_t>(task.type)].fetch_add(1);

    if (std::chrono::steady_clock::now() - task.enqueued_at > config_.task_timeout) {
        timed_out_.fetch_add(1);
        OFFCACHE_DEBUG("Dropping stale background task #{} {}", task.sequence, task.description);
        return;
    }
    try {
        auto result = task.func();
        if (!result.ok()) {
            failed_.fetch_add(1);
            OFFCACHE_DEBUG("Background task #{} {} failed: {}", task.sequence, task.description, result.error());
        }
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        OFFCACHE_WARN("Background task #{} {} threw: {}", task.sequence, task.description, e.what());
    }
}

void BackgroundProcessor::finishTask() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        --active_tasks_;
    }
    idle_condition_.notify_all();
}

void BackgroundProcessor::joinWorkers() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

} // namespace runtime
} // namespace offcache
