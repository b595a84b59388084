#pragma once

#include <atomic>

#include "offcache/core/config.h"
#include "offcache/net/fetcher.h"

namespace offcache {
namespace net {

/**
 * @brief Fetcher backed by cpp-httplib
 *
 * A client is created per request, so concurrent fetches never share a
 * connection. Redirects are followed. https URLs need cpp-httplib built with
 * OpenSSL support; without it they fail as UNAVAILABLE.
 */
class HttpFetcher : public Fetcher {
public:
    explicit HttpFetcher(const core::FetcherConfig& config = core::FetcherConfig{});

    core::Result<core::Response> fetch(const core::Request& request) override;

    uint64_t request_count() const { return request_count_.load(); }
    uint64_t failure_count() const { return failure_count_.load(); }

private:
    core::FetcherConfig config_;
    std::atomic<uint64_t> request_count_{0};
    std::atomic<uint64_t> failure_count_{0};
};

} // namespace net
} // namespace offcache
