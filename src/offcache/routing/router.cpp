#include "offcache/routing/router.h"

#include "offcache/common/logger.h"

namespace offcache {
namespace routing {

Router::Router(const core::Config& config,
               std::shared_ptr<store::CacheStore> store,
               std::shared_ptr<net::Fetcher> fetcher,
               std::shared_ptr<runtime::BackgroundProcessor> background)
    : store_(store),
      fetcher_(fetcher),
      context_{store, fetcher, background},
      origin_config_(config.origin),
      cache_config_(config.cache),
      classifier_(config.origin),
      lifecycle_(store, fetcher, config.origin, config.cache),
      eviction_(store, lifecycle_.registry(), config.cache.image_max_entries),
      dispatcher_(context_, lifecycle_.registry(), config.origin, config.cache) {
}

core::Result<lifecycle::InstallReport> Router::on_install() {
    return lifecycle_.install();
}

core::Result<lifecycle::ActivateReport> Router::on_activate() {
    // Requests pass through while old partitions are deleted, so none is recreated
    std::shared_ptr<const StrategyDispatcher> previous;
    {
        std::lock_guard<std::mutex> lock(previous_mutex_);
        previous = std::move(previous_);
        previous_.reset();
    }
    auto activated = lifecycle_.activate();
    std::lock_guard<std::mutex> lock(previous_mutex_);
    if (activated.ok()) {
        previous_version_.clear();
    } else {
        previous_ = std::move(previous);
    }
    return activated;
}

core::Result<void> Router::start() {
    adopt_complete_version();
    auto installed = on_install();
    if (!installed.ok()) {
        return core::Result<void>::forward(installed);
    }
    if (!installed.value().skip_waiting) {
        OFFCACHE_INFO("Cache version {} installed, waiting for force-activate", version());
        return core::Result<void>();
    }
    auto activated = on_activate();
    if (!activated.ok()) {
        return core::Result<void>::forward(activated);
    }
    return core::Result<void>();
}

core::Result<core::Response> Router::on_intercept(const core::Request& request) {
    stats_.requests.fetch_add(1);

    if (!classifier_.in_scope(request)) {
        return pass_through(request);
    }
    // Keeps a previous version's dispatcher alive for this request
    std::shared_ptr<const StrategyDispatcher> previous;
    const StrategyDispatcher* dispatcher = &dispatcher_;
    if (!lifecycle_.is_active()) {
        previous = previous_dispatcher();
        if (previous) {
            dispatcher = previous.get();
        } else if (!lifecycle_.is_active()) {
            return pass_through(request);
        }
    }
    auto classification = classifier_.classify(request);
    if (!classification) {
        return pass_through(request);
    }

    auto index = static_cast<size_t>(*classification);
    stats_.intercepted.fetch_add(1);
    stats_.by_classification[index].fetch_add(1);

    auto& strategy = dispatcher->dispatch(*classification);
    OFFCACHE_TRACE("{} {} -> {} ({}, {})", request.method, request.url,
                   core::to_string(*classification), strategy.name(), strategy.partition());

    auto outcome = strategy.handle(request);
    if (!outcome.ok()) {
        stats_.failures.fetch_add(1);
        stats_.failures_by_classification[index].fetch_add(1);
        OFFCACHE_DEBUG("{} {} failed: {}", request.method, request.url, outcome.error());
        return core::Result<core::Response>::forward(outcome);
    }

    switch (outcome.value().source) {
        case strategy::ResponseSource::NETWORK:
            stats_.served_from_network.fetch_add(1);
            break;
        case strategy::ResponseSource::CACHE:
            stats_.served_from_cache.fetch_add(1);
            break;
        case strategy::ResponseSource::OFFLINE_FALLBACK:
            stats_.offline_fallbacks.fetch_add(1);
            break;
    }
    return outcome.take_value().response;
}

core::Result<core::Response> Router::pass_through(const core::Request& request) {
    stats_.passed_through.fetch_add(1);
    return fetcher_->fetch(request);
}

void Router::on_command(const std::string& message) {
    auto command = parse_command(message);
    if (!command) {
        stats_.commands_ignored.fetch_add(1);
        OFFCACHE_DEBUG("Ignoring control message '{}'", message);
        return;
    }
    stats_.commands_handled.fetch_add(1);
    execute(*command);
}

void Router::execute(Command command) {
    switch (command) {
        case Command::FORCE_ACTIVATE: {
            if (lifecycle_.state() != lifecycle::LifecycleState::INSTALLED) {
                OFFCACHE_DEBUG("force-activate ignored in state {}", lifecycle::to_string(lifecycle_.state()));
                return;
            }
            auto activated = on_activate();
            if (!activated.ok()) {
                OFFCACHE_WARN("force-activate failed: {}", activated.error());
            }
            return;
        }
        case Command::CLEANUP: {
            auto report = eviction_.cleanup();
            if (!report.ok()) {
                OFFCACHE_WARN("cleanup failed: {}", report.error());
            }
            return;
        }
    }
}

void Router::adopt_complete_version() {
    if (lifecycle_.is_active()) {
        return;
    }
    auto version = lifecycle_.find_complete_version();
    if (!version) {
        OFFCACHE_INFO("No installed cache version in the store, passing requests through until {} activates",
                      lifecycle_.registry().version());
        return;
    }

    std::shared_ptr<const StrategyDispatcher> dispatcher = std::make_shared<StrategyDispatcher>(
        context_, store::PartitionRegistry(*version), origin_config_, cache_config_);
    std::lock_guard<std::mutex> lock(previous_mutex_);
    previous_ = std::move(dispatcher);
    previous_version_ = *version;
    OFFCACHE_INFO("Serving cache version {} until {} activates", *version, lifecycle_.registry().version());
}

std::shared_ptr<const StrategyDispatcher> Router::previous_dispatcher() const {
    std::lock_guard<std::mutex> lock(previous_mutex_);
    return previous_;
}

std::optional<std::string> Router::serving_version() const {
    if (lifecycle_.is_active()) {
        return version();
    }
    std::lock_guard<std::mutex> lock(previous_mutex_);
    if (!previous_) {
        return std::nullopt;
    }
    return previous_version_;
}

RouterStatsSnapshot Router::stats() const {
    RouterStatsSnapshot snap;
    snap.requests = stats_.requests.load();
    snap.intercepted = stats_.intercepted.load();
    snap.passed_through = stats_.passed_through.load();
    snap.served_from_cache = stats_.served_from_cache.load();
    snap.served_from_network = stats_.served_from_network.load();
    snap.offline_fallbacks = stats_.offline_fallbacks.load();
    snap.failures = stats_.failures.load();
    snap.commands_handled = stats_.commands_handled.load();
    snap.commands_ignored = stats_.commands_ignored.load();
    for (size_t i = 0; i < snap.by_classification.size(); ++i) {
        snap.by_classification[i] = stats_.by_classification[i].load();
        snap.failures_by_classification[i] = stats_.failures_by_classification[i].load();
    }
    return snap;
}

} // namespace routing
} // namespace offcache
