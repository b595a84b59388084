#pragma once

#include <optional>
#include <string>

namespace offcache {
namespace common {

/**
 * @brief Minimal absolute URL split into the parts the interception layer needs
 *
 * Scheme and host are lower-cased, an empty path becomes "/" and the
 * fragment is dropped. User info in the authority is discarded.
 */
class Url {
public:
    /**
     * @brief Parse an absolute URL of the form scheme://authority[/path][?query][#fragment]
     * @return The parsed URL, or std::nullopt if the string is not absolute
     */
    static std::optional<Url> Parse(const std::string& text);

    const std::string& scheme() const { return scheme_; }
    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }
    const std::string& path() const { return path_; }
    const std::string& query() const { return query_; }

    bool is_http() const { return scheme_ == "http" || scheme_ == "https"; }

    /// host, plus ":port" when the URL names a port explicitly
    std::string host_port() const;

    /// scheme://host[:port]
    std::string origin() const;

    /// path[?query]
    std::string target() const;

    /// Lower-cased extension of the last path segment, empty if none
    std::string extension() const;

    std::string to_string() const { return origin() + target(); }

private:
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_ = "/";
    std::string query_;
};

/**
 * @brief Lower-case an ASCII string
 */
std::string to_lower(std::string s);

} // namespace common
} // namespace offcache
