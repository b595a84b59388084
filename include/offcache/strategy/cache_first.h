#ifndef OFFCACHE_STRATEGY_CACHE_FIRST_H_
#define OFFCACHE_STRATEGY_CACHE_FIRST_H_

#include <atomic>
#include <string>

#include "offcache/strategy/strategy.h"

namespace offcache {
namespace strategy {

/**
 * @brief Serve from the cache, refreshing the entry in the background
 *
 * A hit returns immediately and spawns a REVALIDATE task whose failures are
 * never seen by the caller. A miss fetches synchronously.
 */
class CacheFirstStrategy : public Strategy {
public:
    CacheFirstStrategy(StrategyContext context, std::string partition);

    core::Result<Outcome> handle(const core::Request& request) override;

    const char* name() const override { return "cache-first"; }
    const std::string& partition() const override { return partition_; }

    uint64_t refreshes_spawned() const { return refreshes_spawned_.load(); }

private:
    void spawn_refresh(const core::Request& request);

    StrategyContext context_;
    std::string partition_;
    std::atomic<uint64_t> refreshes_spawned_{0};
};

} // namespace strategy
} // namespace offcache

#endif // OFFCACHE_STRATEGY_CACHE_FIRST_H_
