#include "offcache/strategy/cache_first.h"

#include "offcache/common/logger.h"

namespace offcache {
namespace strategy {

CacheFirstStrategy::CacheFirstStrategy(StrategyContext context, std::string partition)
    : context_(std::move(context)), partition_(std::move(partition)) {
}

core::Result<Outcome> CacheFirstStrategy::handle(const core::Request& request) {
    if (auto cached = context_.store->match(partition_, request)) {
        spawn_refresh(request);
        Outcome outcome;
        outcome.response = std::move(*cached);
        outcome.source = ResponseSource::CACHE;
        return outcome;
    }

    auto result = context_.fetcher->fetch(request);
    if (!result.ok()) {
        return core::Result<Outcome>::forward(result);
    }

    Outcome outcome;
    outcome.response = result.take_value();
    outcome.source = ResponseSource::NETWORK;
    if (outcome.response.ok()) {
        store_response(*context_.store, partition_, request, outcome.response);
    }
    return outcome;
}

void CacheFirstStrategy::spawn_refresh(const core::Request& request) {
    auto store = context_.store;
    auto fetcher = context_.fetcher;
    auto partition = partition_;

    auto spawned = context_.background->spawnDetached(
        runtime::BackgroundTaskType::REVALIDATE,
        [store, fetcher, partition, request]() -> core::Result<void> {
            auto result = fetcher->fetch(request);
            if (!result.ok()) {
                return core::Result<void>::forward(result);
            }
            const auto& response = result.value();
            if (!response.ok()) {
                return core::Result<void>::error("Refresh got status " + std::to_string(response.status));
            }
            return store->put(partition, request, response);
        },
        "refresh " + request.url);

    if (spawned.ok()) {
        refreshes_spawned_.fetch_add(1);
    } else {
        // Skipped; the next hit tries again
        OFFCACHE_DEBUG("Skipping refresh of {}: {}", request.url, spawned.error());
    }
}

} // namespace strategy
} // namespace offcache
