#ifndef OFFCACHE_STRATEGY_STALE_WHILE_REVALIDATE_H_
#define OFFCACHE_STRATEGY_STALE_WHILE_REVALIDATE_H_

#include <string>

#include "offcache/strategy/strategy.h"

namespace offcache {
namespace strategy {

/**
 * @brief Serve whatever is cached while a fetch updates the entry
 *
 * The fetch starts before the cache lookup and always completes on its own,
 * storing an ok response whether or not anyone is still waiting for it.
 * Without a cached entry the caller waits for that same fetch. When no
 * task can be spawned a miss fetches inline and a hit is served without
 * revalidation.
 */
class StaleWhileRevalidateStrategy : public Strategy {
public:
    StaleWhileRevalidateStrategy(StrategyContext context, std::string partition);

    core::Result<Outcome> handle(const core::Request& request) override;

    const char* name() const override { return "stale-while-revalidate"; }
    const std::string& partition() const override { return partition_; }

private:
    StrategyContext context_;
    std::string partition_;
};

} // namespace strategy
} // namespace offcache

#endif // OFFCACHE_STRATEGY_STALE_WHILE_REVALIDATE_H_
