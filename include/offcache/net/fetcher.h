#pragma once

#include "offcache/core/result.h"
#include "offcache/core/types.h"

namespace offcache {
namespace net {

/**
 * @brief The network as seen by the caching strategies
 *
 * fetch() succeeds whenever a response arrives, whatever its HTTP status;
 * an error result means the transport failed (UNAVAILABLE). Implementations
 * must be callable from several threads at once.
 */
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual core::Result<core::Response> fetch(const core::Request& request) = 0;
};

} // namespace net
} // namespace offcache
