#include "offcache/common/url.h"

#include <algorithm>
#include <cctype>

namespace offcache {
namespace common {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<Url> Url::Parse(const std::string& text) {
    auto sep = text.find("://");
    if (sep == std::string::npos || sep == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme_ = to_lower(text.substr(0, sep));
    if (!std::isalpha(static_cast<unsigned char>(url.scheme_[0]))) {
        return std::nullopt;
    }
    for (char c : url.scheme_) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }

    size_t authority_begin = sep + 3;
    size_t authority_end = text.find_first_of("/?#", authority_begin);
    if (authority_end == std::string::npos) {
        authority_end = text.size();
    }
    std::string authority = text.substr(authority_begin, authority_end - authority_begin);
    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }
    if (authority.empty()) {
        return std::nullopt;
    }

    // [v6-address]:port or host:port
    size_t port_sep = std::string::npos;
    if (authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        if (close + 1 < authority.size() && authority[close + 1] == ':') {
            port_sep = close + 1;
        }
    } else {
        port_sep = authority.rfind(':');
    }
    if (port_sep != std::string::npos) {
        url.port_ = authority.substr(port_sep + 1);
        authority = authority.substr(0, port_sep);
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::nullopt;
        }
    }
    url.host_ = to_lower(authority);
    if (url.host_.empty()) {
        return std::nullopt;
    }

    std::string rest = text.substr(authority_end);
    auto hash = rest.find('#');
    if (hash != std::string::npos) {
        rest = rest.substr(0, hash);
    }
    auto question = rest.find('?');
    if (question != std::string::npos) {
        url.query_ = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }
    url.path_ = rest.empty() ? "/" : rest;
    return url;
}

std::string Url::host_port() const {
    return port_.empty() ? host_ : host_ + ":" + port_;
}

std::string Url::origin() const {
    return scheme_ + "://" + host_port();
}

std::string Url::target() const {
    return query_.empty() ? path_ : path_ + "?" + query_;
}

std::string Url::extension() const {
    auto slash = path_.rfind('/');
    std::string segment = slash == std::string::npos ? path_ : path_.substr(slash + 1);
    auto dot = segment.rfind('.');
    if (dot == std::string::npos || dot + 1 == segment.size()) {
        return std::string();
    }
    return to_lower(segment.substr(dot + 1));
}

} // namespace common
} // namespace offcache
