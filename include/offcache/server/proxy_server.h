#pragma once

#include <memory>
#include <string>

#include "offcache/core/config.h"
#include "offcache/routing/router.h"
#include "offcache/runtime/background_processor.h"
#include "offcache/store/cache_store.h"

namespace offcache {
namespace server {

/**
 * @brief Caching reverse proxy in front of the configured origin
 *
 * Every request not addressed to a control endpoint is rewritten to the
 * origin and handed to Router::on_intercept. Control endpoints:
 *
 *   POST /__offcache/command   body is a control message, answered 202
 *   GET  /__offcache/stats     router, processor and partition counters (JSON)
 *   GET  /__offcache/health    liveness and lifecycle state (JSON)
 */
class ProxyServer {
public:
    ProxyServer(const core::Config& config,
                std::shared_ptr<routing::Router> router,
                std::shared_ptr<store::CacheStore> store,
                std::shared_ptr<runtime::BackgroundProcessor> background);
    ~ProxyServer();

    // Non-copyable
    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @throws core::UnavailableError if the address cannot be bound
     */
    void Start();

    void Stop();

    bool IsRunning() const;

    /**
     * @brief Port actually bound; differs from the configured one when that is 0
     */
    int Port() const;

    std::string GetStatsJson() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace server
} // namespace offcache
