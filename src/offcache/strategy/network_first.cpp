#include "offcache/strategy/network_first.h"

#include <functional>
#include <future>
#include <memory>

#include "offcache/common/logger.h"

namespace offcache {
namespace strategy {

NetworkFirstStrategy::NetworkFirstStrategy(StrategyContext context,
                                           std::string partition,
                                           std::chrono::milliseconds timeout,
                                           std::optional<NavigationFallback> fallback)
    : context_(std::move(context)),
      partition_(std::move(partition)),
      timeout_(timeout),
      fallback_(std::move(fallback)) {
}

core::Result<Outcome> NetworkFirstStrategy::handle(const core::Request& request) {
    using FetchResult = core::Result<core::Response>;

    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();

    auto fetcher = context_.fetcher;
    std::function<core::Result<void>()> fetch = [fetcher, promise, request]() -> core::Result<void> {
        auto result = fetcher->fetch(request);
        core::Result<void> status = result.ok() ? core::Result<void>()
                                                : core::Result<void>::forward(result);
        promise->set_value(std::move(result));
        return status;
    };

    auto spawned = context_.background->spawnDetached(
        runtime::BackgroundTaskType::FETCH, fetch, "network-first " + request.url);
    if (!spawned.ok()) {
        OFFCACHE_DEBUG("Running fetch for {} inline: {}", request.url, spawned.error());
        fetch();
    }
    // Only the task may keep the promise alive, so a dropped task breaks it
    fetch = nullptr;
    promise.reset();

    if (future.wait_for(timeout_) != std::future_status::ready) {
        timeouts_.fetch_add(1);
        OFFCACHE_DEBUG("Network timed out after {} ms for {}", timeout_.count(), request.url);
        return fall_back(request, core::Result<void>::error(
            "Network timed out after " + std::to_string(timeout_.count()) + " ms",
            core::Error::Code::TIMEOUT));
    }

    FetchResult result = FetchResult::error("Fetch abandoned", core::Error::Code::UNAVAILABLE);
    try {
        result = future.get();
    } catch (const std::future_error& e) {
        // The task was dropped before it ran (processor shutting down)
        OFFCACHE_DEBUG("Fetch for {} was dropped: {}", request.url, e.what());
    }

    if (!result.ok()) {
        OFFCACHE_DEBUG("Network failed for {}: {}", request.url, result.error());
        return fall_back(request, core::Result<void>::forward(result));
    }

    Outcome outcome;
    outcome.response = result.take_value();
    outcome.source = ResponseSource::NETWORK;
    if (outcome.response.ok()) {
        store_response(*context_.store, partition_, request, outcome.response);
    }
    return outcome;
}

core::Result<Outcome> NetworkFirstStrategy::fall_back(const core::Request& request,
                                                      core::Result<void> cause) {
    if (auto cached = context_.store->match(partition_, request)) {
        Outcome outcome;
        outcome.response = std::move(*cached);
        outcome.source = ResponseSource::CACHE;
        return outcome;
    }

    if (!fallback_) {
        return core::Result<Outcome>::forward(cause);
    }

    Outcome outcome;
    outcome.source = ResponseSource::OFFLINE_FALLBACK;
    auto offline = context_.store->match(fallback_->offline_partition,
                                         core::Request::Get(fallback_->offline_url));
    if (offline) {
        outcome.response = std::move(*offline);
    } else {
        outcome.response = core::Response::Text(503, fallback_->offline_text);
        outcome.response.url = request.url;
    }
    OFFCACHE_DEBUG("Serving offline fallback ({}) for {}", outcome.response.status, request.url);
    return outcome;
}

} // namespace strategy
} // namespace offcache
