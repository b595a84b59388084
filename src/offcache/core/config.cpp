#include "offcache/core/config.h"

#include <cctype>
#include <vector>

namespace offcache {
namespace core {

bool is_valid_version(const std::string& version) {
    if (version.size() < 2 || version[0] != 'v') {
        return false;
    }
    bool expect_digit = true;
    for (size_t i = 1; i < version.size(); ++i) {
        char c = version[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            expect_digit = false;
        } else if (c == '.' && !expect_digit) {
            expect_digit = true;
        } else {
            return false;
        }
    }
    return !expect_digit;
}

namespace {

std::vector<uint64_t> version_components(const std::string& version) {
    std::vector<uint64_t> parts;
    uint64_t current = 0;
    for (size_t i = 1; i < version.size(); ++i) {
        if (version[i] == '.') {
            parts.push_back(current);
            current = 0;
        } else {
            current = current * 10 + static_cast<uint64_t>(version[i] - '0');
        }
    }
    parts.push_back(current);
    while (parts.size() > 1 && parts.back() == 0) {
        parts.pop_back();
    }
    return parts;
}

} // namespace

int compare_versions(const std::string& a, const std::string& b) {
    auto lhs = version_components(a);
    auto rhs = version_components(b);
    if (lhs == rhs) {
        return 0;
    }
    return lhs < rhs ? -1 : 1;
}

Result<void> Config::Validate() const {
    if (!is_valid_version(cache.version)) {
        return Result<void>::error("Invalid cache version: '" + cache.version + "'",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (origin.origin.rfind("http://", 0) != 0 && origin.origin.rfind("https://", 0) != 0) {
        return Result<void>::error("Origin must be an http(s) URL: '" + origin.origin + "'",
                                   Error::Code::INVALID_ARGUMENT);
    }
    for (const auto& path : cache.precache_manifest) {
        if (path.empty() || path[0] != '/') {
            return Result<void>::error("Manifest entries must be absolute paths: '" + path + "'",
                                       Error::Code::INVALID_ARGUMENT);
        }
    }
    if (cache.api_timeout.count() <= 0 || cache.navigation_timeout.count() <= 0) {
        return Result<void>::error("Network timeouts must be positive", Error::Code::INVALID_ARGUMENT);
    }
    if (cache.image_max_entries == 0) {
        return Result<void>::error("image_max_entries must be greater than 0",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (store.backend != "memory" && store.backend != "file") {
        return Result<void>::error("Unknown store backend: '" + store.backend + "'",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (background_workers == 0) {
        return Result<void>::error("Invalid number of background workers: 0",
                                   Error::Code::INVALID_ARGUMENT);
    }
    if (background_queue_size == 0) {
        return Result<void>::error("Invalid background queue size: 0", Error::Code::INVALID_ARGUMENT);
    }
    return Result<void>();
}

} // namespace core
} // namespace offcache
