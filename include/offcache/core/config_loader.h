#pragma once

#include <string>

#include "offcache/core/config.h"
#include "offcache/core/result.h"

namespace offcache {
namespace core {

/**
 * @brief Reads JSON configuration files on top of the built-in defaults
 *
 * Every section and field is optional; fields present in the document
 * override the corresponding value already held by the target Config.
 *
 * ```
 * {
 *   "origin":  {"origin": "https://www.rescuedogs.me", "image_hosts": ["flagcdn.com"]},
 *   "cache":   {"version": "v2", "api_timeout_ms": 5000, "image_max_entries": 50},
 *   "store":   {"backend": "file", "directory": "/var/cache/offcache"},
 *   "fetcher": {"connect_timeout_ms": 2000},
 *   "server":  {"port": 8080},
 *   "background": {"workers": 4}
 * }
 * ```
 */
class ConfigLoader {
public:
    static Result<void> LoadFile(const std::string& path, Config& config);
    static Result<void> LoadString(const std::string& json, Config& config);
};

} // namespace core
} // namespace offcache
