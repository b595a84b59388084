#include "offcache/store/cache_store.h"

#include <sstream>

namespace offcache {
namespace store {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return std::string();
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

std::vector<std::string> split_vary(const std::string& value) {
    std::vector<std::string> names;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            names.push_back(core::Headers::normalize(item));
        }
    }
    return names;
}

} // namespace

core::Result<core::CacheEntry> make_entry(const core::Request& request,
                                          const core::Response& response) {
    auto key = core::CacheKey::for_request(request);
    if (!key) {
        return core::Result<core::CacheEntry>::error(
            "Refusing to store " + request.method + " request for " + request.url,
            core::Error::Code::INVALID_ARGUMENT);
    }
    if (!response.ok()) {
        return core::Result<core::CacheEntry>::error(
            "Refusing to store status " + std::to_string(response.status) + " for " + request.url,
            core::Error::Code::INVALID_ARGUMENT);
    }

    core::CacheEntry entry;
    entry.key = *key;
    entry.response = response;
    for (const auto& name : split_vary(response.headers.get("vary"))) {
        if (name == "*") {
            return core::Result<core::CacheEntry>::error(
                "Refusing to store response with 'Vary: *' for " + request.url,
                core::Error::Code::INVALID_ARGUMENT);
        }
        entry.vary[name] = request.headers.get(name);
    }
    return entry;
}

bool vary_matches(const core::CacheEntry& entry, const core::Request& request) {
    for (const auto& kv : entry.vary) {
        if (request.headers.get(kv.first) != kv.second) {
            return false;
        }
    }
    return true;
}

uint64_t entry_bytes(const core::CacheEntry& entry) {
    uint64_t bytes = entry.key.method.size() + entry.key.url.size() + entry.response.body.size() +
                     entry.response.status_text.size() + entry.response.url.size();
    for (const auto& kv : entry.response.headers) {
        bytes += kv.first.size() + kv.second.size();
    }
    for (const auto& kv : entry.vary) {
        bytes += kv.first.size() + kv.second.size();
    }
    return bytes;
}

} // namespace store
} // namespace offcache
