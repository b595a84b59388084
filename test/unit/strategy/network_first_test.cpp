#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>

#include "offcache/runtime/background_processor.h"
#include "offcache/store/memory_cache_store.h"
#include "offcache/strategy/cache_first.h"
#include "offcache/strategy/network_first.h"
#include "test_util/fake_fetcher.h"

using namespace offcache;
using namespace offcache::strategy;
using offcache::core::Error;
using offcache::core::Request;
using offcache::core::Response;

namespace {

const std::string kApiUrl = "http://api.example.test/api/dogs";
const std::string kPageUrl = "http://localhost:3000/dogs";
const std::string kOfflineUrl = "http://localhost:3000/offline.html";

} // namespace

class NetworkFirstStrategyTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<store::MemoryCacheStore>();
        fetcher_ = std::make_shared<testutil::FakeFetcher>();

        runtime::BackgroundProcessorConfig config;
        config.num_workers = 4;
        config.worker_wait_timeout = std::chrono::milliseconds(10);
        background_ = std::make_shared<runtime::BackgroundProcessor>(config);
        ASSERT_TRUE(background_->initialize().ok());

        context_.store = store_;
        context_.fetcher = fetcher_;
        context_.background = background_;
    }

    void TearDown() override {
        fetcher_->release_all();
        background_->shutdown();
    }

    NetworkFirstStrategy api_strategy(std::chrono::milliseconds timeout = std::chrono::milliseconds(200)) {
        return NetworkFirstStrategy(context_, "api-v1", timeout);
    }

    std::unique_ptr<NetworkFirstStrategy> navigation_strategy(
            std::chrono::milliseconds timeout = std::chrono::milliseconds(200)) {
        NavigationFallback fallback;
        fallback.offline_partition = "app-shell-v1";
        fallback.offline_url = kOfflineUrl;
        fallback.offline_text = "Offline - Please check your connection";
        return std::make_unique<NetworkFirstStrategy>(context_, "dynamic-v1", timeout, fallback);
    }

    static Request navigation(const std::string& url) {
        return Request::Get(url, "text/html,application/xhtml+xml");
    }

    std::shared_ptr<store::MemoryCacheStore> store_;
    std::shared_ptr<testutil::FakeFetcher> fetcher_;
    std::shared_ptr<runtime::BackgroundProcessor> background_;
    StrategyContext context_;
};

TEST_F(NetworkFirstStrategyTest, FreshResponseIsStored) {
    fetcher_->set_response(kApiUrl, 200, "[1,2,3]", "application/json");
    auto strategy = api_strategy();

    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(result.value().source, ResponseSource::NETWORK);
    EXPECT_EQ(result.value().response.body, "[1,2,3]");

    auto cached = store_->match("api-v1", Request::Get(kApiUrl));
    ASSERT_TRUE(cached.has_value());
    EXPECT_EQ(cached->body, "[1,2,3]");
    EXPECT_EQ(strategy.timeouts(), 0u);
}

TEST_F(NetworkFirstStrategyTest, ErrorStatusIsReturnedButNotStored) {
    fetcher_->set_response(kApiUrl, 500, "boom");
    auto strategy = api_strategy();

    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().response.status, 500);
    EXPECT_EQ(result.value().source, ResponseSource::NETWORK);
    EXPECT_FALSE(store_->match("api-v1", Request::Get(kApiUrl)).has_value());
}

TEST_F(NetworkFirstStrategyTest, NetworkErrorFallsBackToCache) {
    ASSERT_TRUE(store_->put("api-v1", Request::Get(kApiUrl), Response::Text(200, "cached")).ok());
    fetcher_->set_failing(kApiUrl);
    auto strategy = api_strategy();

    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::CACHE);
    EXPECT_EQ(result.value().response.body, "cached");
}

TEST_F(NetworkFirstStrategyTest, NetworkErrorWithoutCacheIsForwarded) {
    fetcher_->set_failing(kApiUrl);
    auto strategy = api_strategy();

    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::UNAVAILABLE);
}

TEST_F(NetworkFirstStrategyTest, TimeoutServesCacheWithinBound) {
    ASSERT_TRUE(store_->put("api-v1", Request::Get(kApiUrl), Response::Text(200, "cached")).ok());
    fetcher_->set_response(kApiUrl, 200, "fresh");
    fetcher_->close_gate(kApiUrl);
    auto strategy = api_strategy(std::chrono::milliseconds(100));

    auto start = std::chrono::steady_clock::now();
    auto result = strategy.handle(Request::Get(kApiUrl));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::CACHE);
    EXPECT_EQ(result.value().response.body, "cached");
    EXPECT_GE(elapsed, std::chrono::milliseconds(100));
    EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
    EXPECT_EQ(strategy.timeouts(), 1u);
}

TEST_F(NetworkFirstStrategyTest, TimeoutWithoutCacheIsTimeoutError) {
    fetcher_->close_gate(kApiUrl);
    auto strategy = api_strategy(std::chrono::milliseconds(50));

    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::TIMEOUT);
}

TEST_F(NetworkFirstStrategyTest, LateResponseIsNeverStored) {
    fetcher_->set_response(kApiUrl, 200, "late");
    fetcher_->close_gate(kApiUrl);
    auto strategy = api_strategy(std::chrono::milliseconds(50));

    auto result = strategy.handle(Request::Get(kApiUrl));
    EXPECT_FALSE(result.ok());

    // The abandoned fetch completes after the caller gave up
    fetcher_->open_gate(kApiUrl);
    ASSERT_TRUE(background_->waitForCompletion().ok());
    EXPECT_EQ(fetcher_->calls(kApiUrl), 1u);
    EXPECT_FALSE(store_->match("api-v1", Request::Get(kApiUrl)).has_value());
}

TEST_F(NetworkFirstStrategyTest, StalledRefreshesDoNotDelayTheRace) {
    // One stalled image refresh per worker, plus one more left queued
    CacheFirstStrategy images(context_, "image-v1");
    for (int i = 0; i < 4; ++i) {
        const std::string url = "http://images.example.test/dog" + std::to_string(i) + ".jpg";
        ASSERT_TRUE(store_->put("image-v1", Request::Get(url), Response::Text(200, "jpeg")).ok());
        fetcher_->set_response(url, 200, "fresh jpeg");
        fetcher_->close_gate(url);
        auto hit = images.handle(Request::Get(url));
        ASSERT_TRUE(hit.ok());
        EXPECT_EQ(hit.value().source, ResponseSource::CACHE);
    }
    EXPECT_EQ(images.refreshes_spawned(), 4u);

    fetcher_->set_response(kApiUrl, 200, "[1]", "application/json");
    auto strategy = api_strategy(std::chrono::milliseconds(500));
    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(result.value().source, ResponseSource::NETWORK);
    EXPECT_EQ(result.value().response.body, "[1]");
    EXPECT_EQ(strategy.timeouts(), 0u);
}

TEST_F(NetworkFirstStrategyTest, NavigationServesCachedPageFirst) {
    ASSERT_TRUE(store_->put("dynamic-v1", navigation(kPageUrl), Response::Text(200, "old page")).ok());
    ASSERT_TRUE(store_->put("app-shell-v1", Request::Get(kOfflineUrl), Response::Text(200, "offline page")).ok());
    fetcher_->set_offline(true);
    auto strategy = navigation_strategy();
    EXPECT_TRUE(strategy->is_navigation());

    auto result = strategy->handle(navigation(kPageUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::CACHE);
    EXPECT_EQ(result.value().response.body, "old page");
}

TEST_F(NetworkFirstStrategyTest, NavigationFallsBackToOfflinePage) {
    ASSERT_TRUE(store_->put("app-shell-v1", Request::Get(kOfflineUrl), Response::Text(200, "offline page")).ok());
    fetcher_->set_offline(true);
    auto strategy = navigation_strategy();

    auto result = strategy->handle(navigation(kPageUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::OFFLINE_FALLBACK);
    EXPECT_EQ(result.value().response.status, 200);
    EXPECT_EQ(result.value().response.body, "offline page");
}

TEST_F(NetworkFirstStrategyTest, NavigationSynthesizesServiceUnavailable) {
    fetcher_->close_gate(kPageUrl);
    auto strategy = navigation_strategy(std::chrono::milliseconds(50));

    auto result = strategy->handle(navigation(kPageUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().source, ResponseSource::OFFLINE_FALLBACK);
    EXPECT_EQ(result.value().response.status, 503);
    EXPECT_EQ(result.value().response.body, "Offline - Please check your connection");
}

TEST_F(NetworkFirstStrategyTest, FallsBackInlineWithoutWorkers) {
    fetcher_->set_response(kApiUrl, 200, "inline");
    background_->shutdown();
    auto strategy = api_strategy();

    auto result = strategy.handle(Request::Get(kApiUrl));
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().response.body, "inline");
    EXPECT_TRUE(store_->match("api-v1", Request::Get(kApiUrl)).has_value());
}
