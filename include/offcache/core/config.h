#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "offcache/core/result.h"

namespace offcache {
namespace core {

/**
 * @brief Which URLs belong to the application and how they are categorised
 */
struct OriginConfig {
    std::string origin = "http://localhost:3000";     // Own origin, scheme://host[:port]
    std::vector<std::string> api_hosts = {"api.rescuedogs.me", "localhost:8000"};
    std::vector<std::string> image_hosts = {"images.rescuedogs.me", "flagcdn.com"};
    std::string api_prefix = "/api/";                  // Reserved API path prefix
    std::string static_prefix = "/_next/static/";      // Reserved build-asset prefix
    std::vector<std::string> image_extensions = {"jpg", "jpeg", "png", "gif", "webp", "svg", "ico"};
};

/**
 * @brief Caching behaviour of one deployable version
 */
struct CacheConfig {
    // Bumped on every change to caching behaviour or to the manifest
    std::string version = "v1";

    // Paths fetched and stored in the app-shell partition at install time
    std::vector<std::string> precache_manifest = {
        "/",
        "/dogs",
        "/organizations",
        "/site.webmanifest",
        "/favicon.ico",
        "/android-chrome-192x192.png",
        "/android-chrome-512x512.png"
    };

    std::string offline_page = "/offline.html";
    std::string offline_text = "Offline - Please check your connection";

    std::chrono::milliseconds api_timeout{5000};
    std::chrono::milliseconds navigation_timeout{3000};

    size_t image_max_entries = 50;     // Capacity kept by cleanup in the image partition
    bool skip_waiting_on_install = true;

    // Delay between attempts after a failed install; 0 disables retries
    std::chrono::milliseconds install_retry_interval{30000};
};

/**
 * @brief CacheStore backend selection
 */
struct StoreConfig {
    std::string backend = "memory";               // "memory" or "file"
    std::string directory = "./offcache-data";    // Root directory for the file backend
    size_t max_entries = 0;                       // 0 = unlimited
    uint64_t max_bytes = 0;                       // 0 = unlimited
};

/**
 * @brief Upstream HTTP client settings
 */
struct FetcherConfig {
    std::chrono::milliseconds connect_timeout{5000};
    std::chrono::milliseconds read_timeout{30000};
    std::string user_agent = "offcache/1.0";
};

/**
 * @brief Host process settings
 */
struct ServerConfig {
    std::string listen_address = "127.0.0.1";
    uint16_t port = 8080;
    size_t num_threads = 8;
};

/**
 * @brief Complete process configuration
 */
struct Config {
    OriginConfig origin;
    CacheConfig cache;
    StoreConfig store;
    FetcherConfig fetcher;
    ServerConfig server;

    uint32_t background_workers = 4;
    uint32_t background_queue_size = 10000;
    uint32_t background_fetch_workers = 1;   // Workers kept free of refreshes

    /**
     * @brief Check the configuration for values the runtime cannot work with
     * @return Ok, or an INVALID_ARGUMENT error naming the offending field
     */
    Result<void> Validate() const;
};

/**
 * @brief Whether a version string matches `v<digits>[.<digits>]*`
 */
bool is_valid_version(const std::string& version);

/**
 * @brief Order two valid versions by their numeric components
 * @return Negative, zero or positive as `a` is older than, equal to or newer than `b`;
 *         missing trailing components count as 0, so v2 equals v2.0
 */
int compare_versions(const std::string& a, const std::string& b);

} // namespace core
} // namespace offcache
