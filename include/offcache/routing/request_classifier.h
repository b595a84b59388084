#ifndef OFFCACHE_ROUTING_REQUEST_CLASSIFIER_H_
#define OFFCACHE_ROUTING_REQUEST_CLASSIFIER_H_

#include <optional>
#include <set>
#include <string>

#include "offcache/common/url.h"
#include "offcache/core/config.h"
#include "offcache/core/types.h"

namespace offcache {
namespace routing {

/**
 * @brief Maps an outgoing request to the Classification that selects its strategy
 *
 * Rules, first match wins:
 *   1. non-GET or non-http(s) URL: not classified
 *   2. reserved API path prefix or allow-listed API host: API
 *   3. allow-listed image host or image file extension: IMAGE
 *   4. reserved build-asset path prefix: STATIC_ASSET
 *   5. Accept names text/html: HTML_NAVIGATION
 *   6. otherwise: DYNAMIC
 *
 * Stateless after construction; safe to share between threads.
 */
class RequestClassifier {
public:
    /**
     * @throws core::InvalidArgumentError if the configured origin is not an http(s) URL
     */
    explicit RequestClassifier(const core::OriginConfig& config);

    std::optional<core::Classification> classify(const core::Request& request) const;

    /**
     * @brief Whether a request is subject to classification at all
     *
     * GET requests to the own origin, an API host or an image host. Everything
     * else passes through to the network and is never stored.
     */
    bool in_scope(const core::Request& request) const;

private:
    static bool host_listed(const std::set<std::string>& hosts, const common::Url& url);

    core::OriginConfig config_;
    std::string origin_;
    std::set<std::string> api_hosts_;
    std::set<std::string> image_hosts_;
    std::set<std::string> image_extensions_;
};

} // namespace routing
} // namespace offcache

#endif // OFFCACHE_ROUTING_REQUEST_CLASSIFIER_H_
