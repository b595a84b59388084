#ifndef OFFCACHE_STRATEGY_NETWORK_FIRST_H_
#define OFFCACHE_STRATEGY_NETWORK_FIRST_H_

#include <atomic>
#include <chrono>
#include <optional>
#include <string>

#include "offcache/strategy/strategy.h"

namespace offcache {
namespace strategy {

/**
 * @brief Synthesized answer for navigations that can be served neither by
 * the network nor by the cache
 */
struct NavigationFallback {
    std::string offline_partition;   // Partition holding the pre-cached offline page
    std::string offline_url;         // Absolute URL of the offline page
    std::string offline_text;        // Body of the 503 used when the page is absent
};

/**
 * @brief Network first, falling back to the cache after a bounded wait
 *
 * The fetch runs as a detached FETCH task racing the caller's timer. When
 * the timer wins the fetch is not cancelled: it runs to completion and its
 * result is dropped without being stored. Only a response the caller
 * actually received in time is written to the partition.
 */
class NetworkFirstStrategy : public Strategy {
public:
    NetworkFirstStrategy(StrategyContext context,
                         std::string partition,
                         std::chrono::milliseconds timeout,
                         std::optional<NavigationFallback> fallback = std::nullopt);

    core::Result<Outcome> handle(const core::Request& request) override;

    const char* name() const override { return "network-first"; }
    const std::string& partition() const override { return partition_; }

    std::chrono::milliseconds timeout() const { return timeout_; }
    bool is_navigation() const { return fallback_.has_value(); }

    uint64_t timeouts() const { return timeouts_.load(); }

private:
    core::Result<Outcome> fall_back(const core::Request& request, core::Result<void> cause);

    StrategyContext context_;
    std::string partition_;
    std::chrono::milliseconds timeout_;
    std::optional<NavigationFallback> fallback_;
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace strategy
} // namespace offcache

#endif // OFFCACHE_STRATEGY_NETWORK_FIRST_H_
