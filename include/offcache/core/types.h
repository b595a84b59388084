#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace offcache {
namespace core {

/**
 * @brief HTTP header map with case-insensitive names
 *
 * Names are stored lower-cased; a repeated header set through add() is
 * folded into a single comma separated value.
 */
class Headers {
public:
    using Map = std::map<std::string, std::string>;

    Headers() = default;
    Headers(std::initializer_list<std::pair<const std::string, std::string>> init);

    void set(const std::string& name, const std::string& value);
    /// Append a value; repeated fields are comma-joined, Set-Cookie lines are kept apart
    void add(const std::string& name, const std::string& value);
    bool has(const std::string& name) const;
    std::string get(const std::string& name) const;
    /// Field lines to emit for a header, one per Set-Cookie value
    std::vector<std::string> values(const std::string& name) const;
    bool erase(const std::string& name);

    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }
    Map::const_iterator begin() const { return map_.begin(); }
    Map::const_iterator end() const { return map_.end(); }

    bool operator==(const Headers& other) const { return map_ == other.map_; }
    bool operator!=(const Headers& other) const { return map_ != other.map_; }

    static std::string normalize(const std::string& name);

private:
    Map map_;
};

/**
 * @brief Outgoing request descriptor as seen by the interception layer
 */
struct Request {
    std::string method = "GET";
    std::string url;
    Headers headers;
    std::string body;     // Forwarded on pass-through, never part of a cache key

    Request() = default;
    Request(std::string m, std::string u) : method(std::move(m)), url(std::move(u)) {}

    bool is_get() const { return method == "GET"; }
    std::string accept() const { return headers.get("accept"); }

    static Request Get(const std::string& url, const std::string& accept = "*/*");
};

/**
 * @brief Response metadata plus an opaque body
 */
struct Response {
    int status = 0;
    std::string status_text;
    Headers headers;
    std::string body;
    std::string url;

    bool ok() const { return status >= 200 && status <= 299; }

    static Response Text(int status, const std::string& body);
};

/**
 * @brief Category assigned to an intercepted GET request
 */
enum class Classification {
    API,
    IMAGE,
    STATIC_ASSET,
    HTML_NAVIGATION,
    DYNAMIC
};

const char* to_string(Classification classification);

constexpr std::array<Classification, 5> kAllClassifications = {
    Classification::API, Classification::IMAGE, Classification::STATIC_ASSET,
    Classification::HTML_NAVIGATION, Classification::DYNAMIC};

/**
 * @brief Resource families, one partition per family and version
 */
enum class PartitionFamily {
    APP_SHELL,
    API,
    IMAGE,
    DYNAMIC
};

const char* family_name(PartitionFamily family);
std::optional<PartitionFamily> family_from_name(const std::string& name);

constexpr std::array<PartitionFamily, 4> kAllFamilies = {
    PartitionFamily::APP_SHELL, PartitionFamily::API,
    PartitionFamily::IMAGE, PartitionFamily::DYNAMIC};

/**
 * @brief Identity of a stored response
 *
 * Only GET requests produce keys.
 */
struct CacheKey {
    std::string method;
    std::string url;

    static std::optional<CacheKey> for_request(const Request& request);

    std::string to_string() const { return method + " " + url; }

    bool operator==(const CacheKey& o) const { return method == o.method && url == o.url; }
    bool operator!=(const CacheKey& o) const { return !(*this == o); }
    bool operator<(const CacheKey& o) const {
        return method != o.method ? method < o.method : url < o.url;
    }
};

/**
 * @brief A stored response
 */
struct CacheEntry {
    CacheKey key;
    Response response;
    // Request header values named by the response's Vary header, captured at store time
    std::map<std::string, std::string> vary;
    // Monotonic write order assigned by the store
    uint64_t stored_at = 0;
};

} // namespace core
} // namespace offcache
