#include "offcache/net/http_fetcher.h"

#include <httplib.h>

#include "offcache/common/logger.h"
#include "offcache/common/url.h"

namespace offcache {
namespace net {

namespace {

// Hop-by-hop and connection-specific headers are not forwarded
bool forwardable(const std::string& name) {
    return name != "host" && name != "connection" && name != "keep-alive" &&
           name != "proxy-connection" && name != "transfer-encoding" && name != "upgrade" &&
           name != "te" && name != "trailer" && name != "content-length" &&
           name != "accept-encoding";
}

} // namespace

HttpFetcher::HttpFetcher(const core::FetcherConfig& config)
    : config_(config) {
}

core::Result<core::Response> HttpFetcher::fetch(const core::Request& request) {
    request_count_.fetch_add(1);

    auto url = common::Url::Parse(request.url);
    if (!url || !url->is_http()) {
        failure_count_.fetch_add(1);
        return core::Result<core::Response>::error("Unsupported URL: " + request.url,
                                                   core::Error::Code::INVALID_ARGUMENT);
    }

    httplib::Client cli(url->origin());
    if (!cli.is_valid()) {
        failure_count_.fetch_add(1);
        return core::Result<core::Response>::error("No HTTP client available for " + url->origin(),
                                                   core::Error::Code::UNAVAILABLE);
    }
    auto connect_ms = config_.connect_timeout.count();
    auto read_ms = config_.read_timeout.count();
    cli.set_connection_timeout(static_cast<time_t>(connect_ms / 1000),
                               static_cast<time_t>((connect_ms % 1000) * 1000));
    cli.set_read_timeout(static_cast<time_t>(read_ms / 1000),
                         static_cast<time_t>((read_ms % 1000) * 1000));
    cli.set_follow_location(true);

    httplib::Request req;
    req.method = request.method;
    req.path = url->target();
    for (const auto& kv : request.headers) {
        if (forwardable(kv.first)) {
            req.headers.emplace(kv.first, kv.second);
        }
    }
    if (!request.headers.has("user-agent")) {
        req.headers.emplace("User-Agent", config_.user_agent);
    }
    req.body = request.body;

    auto res = cli.send(req);
    if (!res) {
        failure_count_.fetch_add(1);
        OFFCACHE_DEBUG("Fetch {} {} failed: {}", request.method, request.url, httplib::to_string(res.error()));
        return core::Result<core::Response>::error(
            request.method + " " + request.url + ": " + httplib::to_string(res.error()),
            core::Error::Code::UNAVAILABLE);
    }

    core::Response response;
    response.status = res->status;
    response.status_text = res->reason;
    response.url = request.url;
    for (const auto& kv : res->headers) {
        if (forwardable(core::Headers::normalize(kv.first))) {
            response.headers.add(kv.first, kv.second);
        }
    }
    response.body = std::move(res->body);
    return response;
}

} // namespace net
} // namespace offcache
