#include "offcache/strategy/stale_while_revalidate.h"

#include <functional>
#include <future>
#include <memory>

#include "offcache/common/logger.h"

namespace offcache {
namespace strategy {

StaleWhileRevalidateStrategy::StaleWhileRevalidateStrategy(StrategyContext context,
                                                           std::string partition)
    : context_(std::move(context)), partition_(std::move(partition)) {
}

core::Result<Outcome> StaleWhileRevalidateStrategy::handle(const core::Request& request) {
    using FetchResult = core::Result<core::Response>;

    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();

    auto store = context_.store;
    auto fetcher = context_.fetcher;
    auto partition = partition_;
    std::function<core::Result<void>()> fetch =
        [store, fetcher, partition, promise, request]() -> core::Result<void> {
            auto result = fetcher->fetch(request);
            core::Result<void> status;
            if (!result.ok()) {
                status = core::Result<void>::forward(result);
            } else if (result.value().ok()) {
                store_response(*store, partition, request, result.value());
            }
            promise->set_value(std::move(result));
            return status;
        };

    bool spawned = true;
    auto spawn = context_.background->spawnDetached(
        runtime::BackgroundTaskType::FETCH, fetch, "revalidate " + request.url);
    if (!spawn.ok()) {
        OFFCACHE_DEBUG("Could not spawn fetch for {}: {}", request.url, spawn.error());
        spawned = false;
    }

    if (auto cached = context_.store->match(partition_, request)) {
        Outcome outcome;
        outcome.response = std::move(*cached);
        outcome.source = ResponseSource::CACHE;
        return outcome;
    }

    if (!spawned) {
        fetch();
    }
    fetch = nullptr;
    promise.reset();

    FetchResult result = FetchResult::error("Fetch abandoned", core::Error::Code::UNAVAILABLE);
    try {
        result = future.get();
    } catch (const std::future_error& e) {
        OFFCACHE_DEBUG("Fetch for {} was dropped: {}", request.url, e.what());
    }

    if (result.ok()) {
        Outcome outcome;
        outcome.response = result.take_value();
        outcome.source = ResponseSource::NETWORK;
        return outcome;
    }

    OFFCACHE_DEBUG("Network failed for {}: {}", request.url, result.error());
    if (auto cached = context_.store->match(partition_, request)) {
        Outcome outcome;
        outcome.response = std::move(*cached);
        outcome.source = ResponseSource::CACHE;
        return outcome;
    }
    return core::Result<Outcome>::forward(result);
}

} // namespace strategy
} // namespace offcache
