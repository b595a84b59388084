#ifndef OFFCACHE_ROUTING_ROUTER_H_
#define OFFCACHE_ROUTING_ROUTER_H_

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "offcache/core/config.h"
#include "offcache/core/result.h"
#include "offcache/core/types.h"
#include "offcache/lifecycle/eviction_manager.h"
#include "offcache/lifecycle/lifecycle_manager.h"
#include "offcache/net/fetcher.h"
#include "offcache/routing/command.h"
#include "offcache/routing/request_classifier.h"
#include "offcache/routing/strategy_dispatcher.h"
#include "offcache/runtime/background_processor.h"
#include "offcache/store/cache_store.h"

namespace offcache {
namespace routing {

/**
 * @brief Router counters
 */
struct RouterStats {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> intercepted{0};
    std::atomic<uint64_t> passed_through{0};
    std::atomic<uint64_t> served_from_cache{0};
    std::atomic<uint64_t> served_from_network{0};
    std::atomic<uint64_t> offline_fallbacks{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> commands_handled{0};
    std::atomic<uint64_t> commands_ignored{0};
    std::array<std::atomic<uint64_t>, 5> by_classification{};
    std::array<std::atomic<uint64_t>, 5> failures_by_classification{};
};

struct RouterStatsSnapshot {
    uint64_t requests = 0;
    uint64_t intercepted = 0;
    uint64_t passed_through = 0;
    uint64_t served_from_cache = 0;
    uint64_t served_from_network = 0;
    uint64_t offline_fallbacks = 0;
    uint64_t failures = 0;
    uint64_t commands_handled = 0;
    uint64_t commands_ignored = 0;
    std::array<uint64_t, 5> by_classification{};
    std::array<uint64_t, 5> failures_by_classification{};

    uint64_t classified(core::Classification c) const { return by_classification[static_cast<size_t>(c)]; }
    uint64_t failed(core::Classification c) const { return failures_by_classification[static_cast<size_t>(c)]; }
};

/**
 * @brief Entry points of the interception layer
 *
 * Wires the classifier, dispatcher, lifecycle and eviction managers around
 * one store and one fetcher. Each handler can be driven on its own:
 *
 * ```
 * Router router(config, store, fetcher, background);
 * router.start();                        // install, then activate
 * auto response = router.on_intercept(core::Request::Get(url));
 * router.on_command("cleanup");
 * ```
 *
 * Until activation completes, requests are served through the newest
 * version that completed an install earlier (see start()); with no such
 * version they pass through to the fetcher and nothing is cached.
 */
class Router {
public:
    /**
     * @throws core::InvalidArgumentError for an invalid origin or version
     */
    Router(const core::Config& config,
           std::shared_ptr<store::CacheStore> store,
           std::shared_ptr<net::Fetcher> fetcher,
           std::shared_ptr<runtime::BackgroundProcessor> background);

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    core::Result<lifecycle::InstallReport> on_install();
    core::Result<lifecycle::ActivateReport> on_activate();

    /**
     * @brief Answer an outgoing request
     * @return The response, or the network error when nothing can stand in for it
     */
    core::Result<core::Response> on_intercept(const core::Request& request);

    /**
     * @brief Handle a control message; returns once the command has completed
     *
     * Unknown or malformed messages are ignored.
     */
    void on_command(const std::string& message);

    /**
     * @brief Install, then activate right away if install asked to skip waiting
     *
     * Before installing, the newest complete version already in the store is
     * adopted for serving, so a failed install (network down, broken
     * manifest) leaves that version answering requests. Calling start()
     * again after a failure retries the install.
     */
    core::Result<void> start();

    /// Version whose partitions answer intercepted requests, if any
    std::optional<std::string> serving_version() const;

    lifecycle::LifecycleState state() const { return lifecycle_.state(); }
    const std::string& version() const { return lifecycle_.registry().version(); }

    RouterStatsSnapshot stats() const;

    const RequestClassifier& classifier() const { return classifier_; }
    const StrategyDispatcher& dispatcher() const { return dispatcher_; }

private:
    core::Result<core::Response> pass_through(const core::Request& request);
    void execute(Command command);
    void adopt_complete_version();
    std::shared_ptr<const StrategyDispatcher> previous_dispatcher() const;

    std::shared_ptr<store::CacheStore> store_;
    std::shared_ptr<net::Fetcher> fetcher_;
    strategy::StrategyContext context_;
    core::OriginConfig origin_config_;
    core::CacheConfig cache_config_;

    RequestClassifier classifier_;
    lifecycle::LifecycleManager lifecycle_;
    lifecycle::EvictionManager eviction_;
    StrategyDispatcher dispatcher_;

    // Serves while this version is not activated
    mutable std::mutex previous_mutex_;
    std::shared_ptr<const StrategyDispatcher> previous_;
    std::string previous_version_;

    RouterStats stats_;
};

} // namespace routing
} // namespace offcache

#endif // OFFCACHE_ROUTING_ROUTER_H_
