#ifndef OFFCACHE_STRATEGY_STRATEGY_H_
#define OFFCACHE_STRATEGY_STRATEGY_H_

#include <memory>
#include <string>

#include "offcache/core/result.h"
#include "offcache/core/types.h"
#include "offcache/net/fetcher.h"
#include "offcache/runtime/background_processor.h"
#include "offcache/store/cache_store.h"

namespace offcache {
namespace strategy {

/**
 * @brief Where the response handed back by a strategy came from
 */
enum class ResponseSource {
    NETWORK,
    CACHE,
    OFFLINE_FALLBACK
};

const char* to_string(ResponseSource source);

/**
 * @brief A response together with its origin
 */
struct Outcome {
    core::Response response;
    ResponseSource source = ResponseSource::NETWORK;
};

/**
 * @brief Collaborators shared by every strategy
 *
 * Detached tasks copy these pointers, so the store and fetcher outlive any
 * request that is still refreshing when its caller has already returned.
 */
struct StrategyContext {
    std::shared_ptr<store::CacheStore> store;
    std::shared_ptr<net::Fetcher> fetcher;
    std::shared_ptr<runtime::BackgroundProcessor> background;
};

/**
 * @brief An algorithm combining cache lookup and network fetch for one partition
 */
class Strategy {
public:
    virtual ~Strategy() = default;

    /**
     * @brief Serve a classified GET request
     * @return The response, or the network error when no fallback applies
     */
    virtual core::Result<Outcome> handle(const core::Request& request) = 0;

    virtual const char* name() const = 0;

    /// Name of the partition this instance reads and writes
    virtual const std::string& partition() const = 0;
};

/**
 * @brief Store a copy of an ok response, logging a failed write instead of failing
 * @return true if the write succeeded
 */
bool store_response(store::CacheStore& store,
                    const std::string& partition,
                    const core::Request& request,
                    const core::Response& response);

} // namespace strategy
} // namespace offcache

#endif // OFFCACHE_STRATEGY_STRATEGY_H_
