#include "offcache/strategy/strategy.h"

#include "offcache/common/logger.h"

namespace offcache {
namespace strategy {

const char* to_string(ResponseSource source) {
    switch (source) {
        case ResponseSource::NETWORK: return "network";
        case ResponseSource::CACHE: return "cache";
        case ResponseSource::OFFLINE_FALLBACK: return "offline-fallback";
    }
    return "unknown";
}

bool store_response(store::CacheStore& store,
                    const std::string& partition,
                    const core::Request& request,
                    const core::Response& response) {
    auto result = store.put(partition, request, response);
    if (!result.ok()) {
        OFFCACHE_WARN("Failed to store {} {} in {}: {} ({})", request.method, request.url,
                      partition, result.error(), core::code_name(result.error_code()));
        return false;
    }
    return true;
}

} // namespace strategy
} // namespace offcache
