#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "offcache/core/result.h"

namespace offcache {
namespace runtime {

/**
 * @brief What a detached task is doing; selects its priority
 */
enum class BackgroundTaskType {
    FETCH = 0,        // Network fetch a request path may be waiting for
    COMMAND = 1,      // Control channel message
    REVALIDATE = 2    // Fire-and-forget cache refresh
};

using TaskFunction = std::function<core::Result<void>()>;

struct BackgroundProcessorConfig {
    uint32_t num_workers = 4;
    uint32_t max_queue_size = 10000;
    // Workers that only run FETCH tasks; at least one worker always takes any type
    uint32_t reserved_fetch_workers = 1;
    std::chrono::milliseconds task_timeout{60000};       // Tasks queued longer than this are dropped
    std::chrono::milliseconds worker_wait_timeout{100};  // Worker polling interval
};

struct BackgroundProcessorStatsSnapshot {
    uint64_t tasks_submitted = 0;
    uint64_t tasks_rejected = 0;
    uint64_t tasks_processed = 0;
    uint64_t tasks_failed = 0;
    uint64_t tasks_timeout = 0;
    uint64_t tasks_dropped = 0;
    uint64_t fetch_tasks = 0;
    uint64_t command_tasks = 0;
    uint64_t revalidate_tasks = 0;
    uint64_t queue_size = 0;
};

/**
 * @brief Worker pool running detached tasks off the request path
 *
 * A detached task's outcome is never reported to whoever spawned it:
 * failed results and exceptions are counted and logged, nothing more. Its
 * lifetime is not tied to the spawning request; captured state must be
 * owned by the task (shared_ptr), not borrowed from the caller's stack.
 *
 * Tasks still queued at shutdown, or queued longer than task_timeout, are
 * dropped without running; their function (and anything it owns, such as
 * a std::promise) is destroyed.
 *
 * The first reserved_fetch_workers workers never pick up COMMAND or
 * REVALIDATE tasks, so a request racing a FETCH against its timer is not
 * queued behind refreshes that occupy the other workers.
 */
class BackgroundProcessor {
public:
    explicit BackgroundProcessor(const BackgroundProcessorConfig& config = BackgroundProcessorConfig{});
    ~BackgroundProcessor();

    BackgroundProcessor(const BackgroundProcessor&) = delete;
    BackgroundProcessor& operator=(const BackgroundProcessor&) = delete;

    /**
     * @brief Start the worker threads
     */
    core::Result<void> initialize();

    /**
     * @brief Stop accepting tasks, drop queued ones and join the workers
     *
     * Blocks until every running task has returned.
     */
    core::Result<void> shutdown();

    /**
     * @brief Run a function detached from the caller
     * @param type Task category, also selects its priority
     * @param task_func Function to run; its result is observed only by the processor
     * @param description Shown in logs when the task fails
     * @return UNAVAILABLE when not running, RESOURCE_EXHAUSTED when the queue
     *         is full; in both cases the function will not run
     */
    core::Result<void> spawnDetached(BackgroundTaskType type,
                                     TaskFunction task_func,
                                     std::string description = std::string());

    /**
     * @brief Wait until the queue is empty and no task is running
     */
    core::Result<void> waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    BackgroundProcessorStatsSnapshot getStats() const;

    bool isRunning() const { return running_.load(); }

    /// Reserved FETCH workers actually started, never all of them
    uint32_t fetchOnlyWorkers() const { return fetch_only_workers_; }

    uint32_t getQueueSize() const;

private:
    struct Task {
        BackgroundTaskType type;
        TaskFunction func;
        std::string description;
        std::chrono::steady_clock::time_point enqueued_at;
        uint64_t sequence = 0;
    };

    // Lower type value first, then FIFO
    struct TaskOrder {
        bool operator()(const std::unique_ptr<Task>& a, const std::unique_ptr<Task>& b) const {
            if (a->type != b->type) {
                return a->type > b->type;
            }
            return a->sequence > b->sequence;
        }
    };

    void workerLoop(bool fetch_only);
    std::unique_ptr<Task> takeTask(bool fetch_only);
    bool hasTaskFor(bool fetch_only) const;
    void runTask(Task& task);
    void finishTask();
    void joinWorkers();

    BackgroundProcessorConfig config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    std::priority_queue<std::unique_ptr<Task>, std::vector<std::unique_ptr<Task>>, TaskOrder> queue_;
    uint64_t next_sequence_ = 1;
    uint32_t active_tasks_ = 0;   // Guarded by queue_mutex_
    uint32_t fetch_only_workers_ = 0;

    std::atomic<uint64_t> submitted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> timed_out_{0};
    std::atomic<uint64_t> dropped_{0};
    std::array<std::atomic<uint64_t>, 3> by_type_{};

    std::vector<std::thread> workers_;
};

} // namespace runtime
} // namespace offcache
