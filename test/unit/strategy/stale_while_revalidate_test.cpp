#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>

#include "offcache/runtime/background_processor.h"
#include "offcache/store/memory_cache_store.h"
#include "offcache/strategy/stale_while_revalidate.h"
#include "test_util/fake_fetcher.h"

using namespace offcache;
using namespace offcache::strategy;
using offcache::core::Error;
using offcache::core::Request;
using offcache::core::Response;

namespace {
const std::string kUrl = "http://localhost:3000/site.webmanifest";
}

class StaleWhileRevalidateTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<store::MemoryCacheStore>();
        fetcher_ = std::make_shared<testutil::FakeFetcher>();

        runtime::BackgroundProcessorConfig config;
        config.num_workers = 2;
        config.worker_wait_timeout = std::chrono::milliseconds(10);
        background_ = std::make_shared<runtime::BackgroundProcessor>(config);
        ASSERT_TRUE(background_->initialize().ok());

        StrategyContext context;
        context.store = store_;
        context.fetcher = fetcher_;
        context.background = background_;
        strategy_ = std::make_unique<StaleWhileRevalidateStrategy>(context, "dynamic-v1");
    }

    void TearDown() override {
        fetcher_->release_all();
        background_->shutdown();
    }

    std::shared_ptr<store::MemoryCacheStore> store_;
    std::shared_ptr<testutil::FakeFetcher> fetcher_;
    std::shared_ptr<runtime::BackgroundProcessor> background_;
    std::unique_ptr<StaleWhileRevalidateStrategy> strategy_;
};

TEST_F(StaleWhileRevalidateTest, FirstRequestWaitsForNetworkAndStores) {
    fetcher_->set_response(kUrl, 200, "{\"name\":\"app\"}", "application/manifest+json");

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::NETWORK);
    EXPECT_EQ(result.value().response.body, "{\"name\":\"app\"}");

    auto cached = store_->match("dynamic-v1", Request::Get(kUrl));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body, "{\"name\":\"app\"}");
}

TEST_F(StaleWhileRevalidateTest, CachedEntryServedWhileNetworkStalls) {
    ASSERT_TRUE(store_->put("dynamic-v1", Request::Get(kUrl), Response::Text(200, "stale")).ok());
    fetcher_->set_response(kUrl, 200, "fresh");
    fetcher_->close_gate(kUrl);

    auto start = std::chrono::steady_clock::now();
    auto result = strategy_->handle(Request::Get(kUrl));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::CACHE);
    EXPECT_EQ(result.value().response.body, "stale");
    EXPECT_LT(elapsed, std::chrono::milliseconds(500));

    // The fetch still lands in the cache once the network answers
    fetcher_->open_gate(kUrl);
    ASSERT_TRUE(background_->waitForCompletion().ok());
    EXPECT_EQ(store_->match("dynamic-v1", Request::Get(kUrl))->body, "fresh");
}

TEST_F(StaleWhileRevalidateTest, EveryRequestRevalidates) {
    fetcher_->set_response(kUrl, 200, "v");
    fetcher_->set_stamp_bodies(true);

    auto first = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.value().response.body, "v#1");

    auto second = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(second.ok());
    ASSERT_TRUE(background_->waitForCompletion().ok());
    EXPECT_EQ(fetcher_->calls(kUrl), 2u);
    EXPECT_EQ(store_->match("dynamic-v1", Request::Get(kUrl))->body, "v#2");
}

TEST_F(StaleWhileRevalidateTest, ErrorStatusIsReturnedButNotStored) {
    fetcher_->set_response(kUrl, 500, "upstream broke");

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().response.status, 500);
    EXPECT_EQ(store_->size("dynamic-v1"), 0u);
}

TEST_F(StaleWhileRevalidateTest, ErrorStatusDoesNotReplaceCachedEntry) {
    ASSERT_TRUE(store_->put("dynamic-v1", Request::Get(kUrl), Response::Text(200, "good")).ok());
    fetcher_->set_response(kUrl, 500, "upstream broke");

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().response.body, "good");
    ASSERT_TRUE(background_->waitForCompletion().ok());
    EXPECT_EQ(store_->match("dynamic-v1", Request::Get(kUrl))->body, "good");
}

TEST_F(StaleWhileRevalidateTest, NetworkErrorWithoutCacheFails) {
    fetcher_->set_offline(true);

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::UNAVAILABLE);
}

TEST_F(StaleWhileRevalidateTest, NetworkErrorWithCacheServesCache) {
    ASSERT_TRUE(store_->put("dynamic-v1", Request::Get(kUrl), Response::Text(200, "offline copy")).ok());
    fetcher_->set_offline(true);

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::CACHE);
    EXPECT_EQ(result.value().response.body, "offline copy");
}

TEST_F(StaleWhileRevalidateTest, HitWithoutWorkersSkipsRevalidation) {
    ASSERT_TRUE(store_->put("dynamic-v1", Request::Get(kUrl), Response::Text(200, "stale")).ok());
    fetcher_->set_response(kUrl, 200, "fresh");
    background_->shutdown();

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::CACHE);
    EXPECT_EQ(result.value().response.body, "stale");
    EXPECT_EQ(fetcher_->total_calls(), 0u);
    EXPECT_EQ(store_->match("dynamic-v1", Request::Get(kUrl))->body, "stale");
}

TEST_F(StaleWhileRevalidateTest, RunsInlineWithoutWorkers) {
    fetcher_->set_response(kUrl, 200, "inline");
    background_->shutdown();

    auto result = strategy_->handle(Request::Get(kUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::NETWORK);
    EXPECT_EQ(store_->size("dynamic-v1"), 1u);
}
