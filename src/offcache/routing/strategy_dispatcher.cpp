#include "offcache/routing/strategy_dispatcher.h"

#include "offcache/common/url.h"
#include "offcache/core/error.h"
#include "offcache/strategy/cache_first.h"
#include "offcache/strategy/network_first.h"
#include "offcache/strategy/stale_while_revalidate.h"

namespace offcache {
namespace routing {

const char* to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::NETWORK_FIRST: return "network-first";
        case StrategyKind::CACHE_FIRST: return "cache-first";
        case StrategyKind::STALE_WHILE_REVALIDATE: return "stale-while-revalidate";
    }
    return "unknown";
}

StrategyBinding StrategyDispatcher::binding(core::Classification classification,
                                            const core::CacheConfig& cache) {
    switch (classification) {
        case core::Classification::API:
            return {StrategyKind::NETWORK_FIRST, core::PartitionFamily::API, cache.api_timeout, false};
        case core::Classification::HTML_NAVIGATION:
            return {StrategyKind::NETWORK_FIRST, core::PartitionFamily::DYNAMIC, cache.navigation_timeout, true};
        case core::Classification::IMAGE:
            return {StrategyKind::CACHE_FIRST, core::PartitionFamily::IMAGE, std::nullopt, false};
        case core::Classification::STATIC_ASSET:
            return {StrategyKind::CACHE_FIRST, core::PartitionFamily::APP_SHELL, std::nullopt, false};
        case core::Classification::DYNAMIC:
            break;
    }
    return {StrategyKind::STALE_WHILE_REVALIDATE, core::PartitionFamily::DYNAMIC, std::nullopt, false};
}

StrategyDispatcher::StrategyDispatcher(strategy::StrategyContext context,
                                       const store::PartitionRegistry& registry,
                                       const core::OriginConfig& origin,
                                       const core::CacheConfig& cache) {
    auto origin_url = common::Url::Parse(origin.origin);
    if (!origin_url) {
        throw core::InvalidArgumentError("Invalid origin: '" + origin.origin + "'");
    }

    strategy::NavigationFallback fallback;
    fallback.offline_partition = registry.current(core::PartitionFamily::APP_SHELL);
    fallback.offline_url = origin_url->origin() + cache.offline_page;
    fallback.offline_text = cache.offline_text;

    for (auto classification : core::kAllClassifications) {
        auto bound = binding(classification, cache);
        auto partition = registry.current(bound.family);
        std::unique_ptr<strategy::Strategy> instance;
        switch (bound.kind) {
            case StrategyKind::NETWORK_FIRST:
                instance = std::make_unique<strategy::NetworkFirstStrategy>(
                    context, partition, *bound.timeout,
                    bound.navigation ? std::optional<strategy::NavigationFallback>(fallback) : std::nullopt);
                break;
            case StrategyKind::CACHE_FIRST:
                instance = std::make_unique<strategy::CacheFirstStrategy>(context, partition);
                break;
            case StrategyKind::STALE_WHILE_REVALIDATE:
                instance = std::make_unique<strategy::StaleWhileRevalidateStrategy>(context, partition);
                break;
        }
        strategies_[classification] = std::move(instance);
    }
}

strategy::Strategy& StrategyDispatcher::dispatch(core::Classification classification) const {
    return *strategies_.at(classification);
}

} // namespace routing
} // namespace offcache
