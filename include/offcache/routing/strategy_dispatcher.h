#ifndef OFFCACHE_ROUTING_STRATEGY_DISPATCHER_H_
#define OFFCACHE_ROUTING_STRATEGY_DISPATCHER_H_

#include <chrono>
#include <map>
#include <memory>
#include <optional>

#include "offcache/core/config.h"
#include "offcache/core/types.h"
#include "offcache/store/partition_registry.h"
#include "offcache/strategy/strategy.h"

namespace offcache {
namespace routing {

enum class StrategyKind {
    NETWORK_FIRST,
    CACHE_FIRST,
    STALE_WHILE_REVALIDATE
};

const char* to_string(StrategyKind kind);

/**
 * @brief Static strategy parameters for one classification
 */
struct StrategyBinding {
    StrategyKind kind;
    core::PartitionFamily family;
    std::optional<std::chrono::milliseconds> timeout;   // NETWORK_FIRST only
    bool navigation = false;                            // Synthesizes an offline response
};

/**
 * @brief Routes a classification to its strategy instance
 *
 * One strategy per classification is built up front against the partitions of
 * the registry's version; dispatch() is a lookup.
 */
class StrategyDispatcher {
public:
    StrategyDispatcher(strategy::StrategyContext context,
                       const store::PartitionRegistry& registry,
                       const core::OriginConfig& origin,
                       const core::CacheConfig& cache);

    /**
     * @brief The binding table
     *
     *   API             -> network-first, api, api_timeout
     *   HTML_NAVIGATION -> network-first, dynamic, navigation_timeout, offline fallback
     *   IMAGE           -> cache-first, image
     *   STATIC_ASSET    -> cache-first, app-shell
     *   DYNAMIC         -> stale-while-revalidate, dynamic
     */
    static StrategyBinding binding(core::Classification classification, const core::CacheConfig& cache);

    strategy::Strategy& dispatch(core::Classification classification) const;

private:
    std::map<core::Classification, std::unique_ptr<strategy::Strategy>> strategies_;
};

} // namespace routing
} // namespace offcache

#endif // OFFCACHE_ROUTING_STRATEGY_DISPATCHER_H_
