#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "offcache/runtime/background_processor.h"

using namespace offcache::runtime;
using namespace offcache::core;

class BackgroundProcessorTest : public ::testing::Test {
protected:
    void SetUp() override {
        BackgroundProcessorConfig config;
        config.num_workers = 2;
        config.max_queue_size = 100;
        config.task_timeout = std::chrono::milliseconds(10000);
        config.worker_wait_timeout = std::chrono::milliseconds(20);

        processor_ = std::make_unique<BackgroundProcessor>(config);
        auto result = processor_->initialize();
        ASSERT_TRUE(result.ok()) << "Failed to initialize background processor: " << result.error();
    }

    void TearDown() override {
        if (processor_) {
            processor_->shutdown();
        }
    }

    // Helper function to wait for a condition with timeout
    template<typename Predicate>
    bool waitForCondition(Predicate pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto start = std::chrono::steady_clock::now();
        while (!pred()) {
            if (std::chrono::steady_clock::now() - start > timeout) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return true;
    }

    std::unique_ptr<BackgroundProcessor> processor_;
};

TEST_F(BackgroundProcessorTest, InvalidInitialization) {
    BackgroundProcessorConfig config;
    config.num_workers = 0;
    BackgroundProcessor processor(config);
    auto result = processor.initialize();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_FALSE(processor.isRunning());

    BackgroundProcessorConfig queue_config;
    queue_config.max_queue_size = 0;
    BackgroundProcessor zero_queue(queue_config);
    EXPECT_FALSE(zero_queue.initialize().ok());
}

TEST_F(BackgroundProcessorTest, DoubleInitialization) {
    EXPECT_TRUE(processor_->isRunning());
    EXPECT_FALSE(processor_->initialize().ok());
}

TEST_F(BackgroundProcessorTest, DetachedTasksRun) {
    std::atomic<int> ran{0};
    for (int i = 0; i < 10; ++i) {
        auto result = processor_->spawnDetached(BackgroundTaskType::REVALIDATE, [&ran]() {
            ran++;
            return Result<void>();
        });
        ASSERT_TRUE(result.ok());
    }
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    EXPECT_EQ(ran.load(), 10);

    auto stats = processor_->getStats();
    EXPECT_EQ(stats.tasks_submitted, 10u);
    EXPECT_EQ(stats.tasks_processed, 10u);
    EXPECT_EQ(stats.revalidate_tasks, 10u);
    EXPECT_EQ(stats.tasks_failed, 0u);
}

TEST_F(BackgroundProcessorTest, FailuresAreCountedNotPropagated) {
    auto failing = processor_->spawnDetached(BackgroundTaskType::REVALIDATE, []() {
        return Result<void>::error("network down", Error::Code::UNAVAILABLE);
    });
    auto throwing = processor_->spawnDetached(BackgroundTaskType::FETCH, []() -> Result<void> {
        throw std::runtime_error("boom");
    });
    EXPECT_TRUE(failing.ok());
    EXPECT_TRUE(throwing.ok());

    ASSERT_TRUE(processor_->waitForCompletion().ok());
    auto stats = processor_->getStats();
    EXPECT_EQ(stats.tasks_failed, 2u);
    EXPECT_EQ(stats.tasks_processed, 2u);
    EXPECT_TRUE(processor_->isRunning());

    // Workers survive a throwing task
    std::promise<void> done;
    ASSERT_TRUE(processor_->spawnDetached(BackgroundTaskType::COMMAND, [&done]() {
        done.set_value();
        return Result<void>();
    }).ok());
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
}

TEST_F(BackgroundProcessorTest, SpawnerDoesNotWaitForTask) {
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    std::atomic<bool> finished{false};

    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(processor_->spawnDetached(BackgroundTaskType::REVALIDATE, [gate_future, &finished]() {
        gate_future.wait();
        finished = true;
        return Result<void>();
    }).ok());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(500));
    EXPECT_FALSE(finished.load());
    gate.set_value();
    EXPECT_TRUE(waitForCondition([&finished] { return finished.load(); }));
}

TEST_F(BackgroundProcessorTest, FetchTasksRunBeforeRevalidation) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());

    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::COMMAND, [gate_future]() {
        gate_future.wait();
        return Result<void>();
    }).ok());
    // Let the single worker pick up the blocking task
    ASSERT_TRUE(waitForCondition([&processor] { return processor.getQueueSize() == 0; }));

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&order_mutex, &order](const std::string& name) {
        return [&order_mutex, &order, name]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(name);
            return Result<void>();
        };
    };
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::REVALIDATE, record("refresh")).ok());
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::FETCH, record("fetch")).ok());
    gate.set_value();

    ASSERT_TRUE(processor.waitForCompletion().ok());
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "fetch");
    EXPECT_EQ(order[1], "refresh");
    processor.shutdown();
}

TEST_F(BackgroundProcessorTest, ReservedWorkerRunsFetchWhileRefreshesBlock) {
    // Fixture: two workers, the default one of them reserved for fetches
    EXPECT_EQ(processor_->fetchOnlyWorkers(), 1u);

    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    std::atomic<int> refreshes_started{0};
    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(processor_->spawnDetached(BackgroundTaskType::REVALIDATE, [gate_future, &refreshes_started]() {
            refreshes_started++;
            gate_future.wait();
            return Result<void>();
        }).ok());
    }
    ASSERT_TRUE(waitForCondition([&refreshes_started] { return refreshes_started.load() == 1; }));

    std::promise<void> fetched;
    auto fetched_future = fetched.get_future();
    ASSERT_TRUE(processor_->spawnDetached(BackgroundTaskType::FETCH, [&fetched]() {
        fetched.set_value();
        return Result<void>();
    }).ok());
    EXPECT_EQ(fetched_future.wait_for(std::chrono::seconds(2)), std::future_status::ready);

    // The second refresh stays queued: the reserved worker does not take it
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(refreshes_started.load(), 1);
    EXPECT_EQ(processor_->getQueueSize(), 1u);

    gate.set_value();
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    EXPECT_EQ(refreshes_started.load(), 2);
}

TEST_F(BackgroundProcessorTest, SingleWorkerIsNeverReserved) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.reserved_fetch_workers = 4;
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());
    EXPECT_EQ(processor.fetchOnlyWorkers(), 0u);

    std::promise<void> done;
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::REVALIDATE, [&done]() {
        done.set_value();
        return Result<void>();
    }).ok());
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);
    processor.shutdown();
}

TEST_F(BackgroundProcessorTest, QueueFullRejects) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.max_queue_size = 2;
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());

    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    auto blocker = [gate_future]() {
        gate_future.wait();
        return Result<void>();
    };
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::COMMAND, blocker).ok());
    ASSERT_TRUE(waitForCondition([&processor] { return processor.getQueueSize() == 0; }));

    EXPECT_TRUE(processor.spawnDetached(BackgroundTaskType::REVALIDATE, blocker).ok());
    EXPECT_TRUE(processor.spawnDetached(BackgroundTaskType::REVALIDATE, blocker).ok());
    auto rejected = processor.spawnDetached(BackgroundTaskType::REVALIDATE, blocker);
    EXPECT_FALSE(rejected.ok());
    EXPECT_EQ(rejected.error_code(), Error::Code::RESOURCE_EXHAUSTED);
    EXPECT_EQ(processor.getStats().tasks_rejected, 1u);

    gate.set_value();
    ASSERT_TRUE(processor.waitForCompletion().ok());
    processor.shutdown();
}

TEST_F(BackgroundProcessorTest, ShutdownDropsQueuedTasks) {
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    BackgroundProcessor processor(config);
    ASSERT_TRUE(processor.initialize().ok());

    std::promise<void> started;
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::COMMAND, [&started, gate_future]() {
        started.set_value();
        gate_future.wait();
        return Result<void>();
    }).ok());
    started.get_future().wait();

    // A queued task owning a promise: dropping it must break the promise
    auto promise = std::make_shared<std::promise<int>>();
    auto future = promise->get_future();
    ASSERT_TRUE(processor.spawnDetached(BackgroundTaskType::FETCH, [promise]() {
        promise->set_value(1);
        return Result<void>();
    }).ok());
    promise.reset();

    std::thread releaser([&gate] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.set_value();
    });
    processor.shutdown();
    releaser.join();

    EXPECT_FALSE(processor.isRunning());
    EXPECT_EQ(processor.getStats().tasks_dropped, 1u);
    EXPECT_THROW(future.get(), std::future_error);

    auto after = processor.spawnDetached(BackgroundTaskType::FETCH, []() { return Result<void>(); });
    EXPECT_FALSE(after.ok());
    EXPECT_EQ(after.error_code(), Error::Code::UNAVAILABLE);
}

TEST_F(BackgroundProcessorTest, WaitForCompletionTimesOut) {
    std::promise<void> gate;
    auto gate_future = gate.get_future().share();
    ASSERT_TRUE(processor_->spawnDetached(BackgroundTaskType::REVALIDATE, [gate_future]() {
        gate_future.wait();
        return Result<void>();
    }).ok());

    auto result = processor_->waitForCompletion(std::chrono::milliseconds(50));
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::TIMEOUT);

    gate.set_value();
    EXPECT_TRUE(processor_->waitForCompletion().ok());
}
