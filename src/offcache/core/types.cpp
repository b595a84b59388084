#include "offcache/core/types.h"

#include <algorithm>
#include <cctype>

namespace offcache {
namespace core {

Headers::Headers(std::initializer_list<std::pair<const std::string, std::string>> init) {
    for (const auto& kv : init) {
        set(kv.first, kv.second);
    }
}

std::string Headers::normalize(const std::string& name) {
    std::string out = name;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void Headers::set(const std::string& name, const std::string& value) {
    map_[normalize(name)] = value;
}

namespace {

// Set-Cookie values may contain commas, so they cannot be comma-joined
const char* kSetCookie = "set-cookie";
const char kFieldLineSeparator = '\n';

} // namespace

void Headers::add(const std::string& name, const std::string& value) {
    auto key = normalize(name);
    auto it = map_.find(key);
    if (it == map_.end()) {
        map_.emplace(std::move(key), value);
    } else if (it->first == kSetCookie) {
        it->second += kFieldLineSeparator + value;
    } else {
        it->second += ", " + value;
    }
}

bool Headers::has(const std::string& name) const {
    return map_.count(normalize(name)) > 0;
}

std::string Headers::get(const std::string& name) const {
    auto it = map_.find(normalize(name));
    return it == map_.end() ? std::string() : it->second;
}

std::vector<std::string> Headers::values(const std::string& name) const {
    std::vector<std::string> out;
    auto it = map_.find(normalize(name));
    if (it == map_.end()) {
        return out;
    }
    if (it->first != kSetCookie) {
        out.push_back(it->second);
        return out;
    }
    size_t start = 0;
    while (true) {
        size_t end = it->second.find(kFieldLineSeparator, start);
        out.push_back(it->second.substr(start, end == std::string::npos ? std::string::npos : end - start));
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return out;
}

bool Headers::erase(const std::string& name) {
    return map_.erase(normalize(name)) > 0;
}

Request Request::Get(const std::string& url, const std::string& accept) {
    Request request("GET", url);
    request.headers.set("Accept", accept);
    return request;
}

Response Response::Text(int status, const std::string& body) {
    Response response;
    response.status = status;
    response.headers.set("Content-Type", "text/plain");
    response.body = body;
    return response;
}

const char* to_string(Classification classification) {
    switch (classification) {
        case Classification::API: return "api";
        case Classification::IMAGE: return "image";
        case Classification::STATIC_ASSET: return "static-asset";
        case Classification::HTML_NAVIGATION: return "html-navigation";
        case Classification::DYNAMIC: return "dynamic";
    }
    return "unknown";
}

const char* family_name(PartitionFamily family) {
    switch (family) {
        case PartitionFamily::APP_SHELL: return "app-shell";
        case PartitionFamily::API: return "api";
        case PartitionFamily::IMAGE: return "image";
        case PartitionFamily::DYNAMIC: return "dynamic";
    }
    return "unknown";
}

std::optional<PartitionFamily> family_from_name(const std::string& name) {
    for (auto family : kAllFamilies) {
        if (name == family_name(family)) {
            return family;
        }
    }
    return std::nullopt;
}

std::optional<CacheKey> CacheKey::for_request(const Request& request) {
    if (!request.is_get()) {
        return std::nullopt;
    }
    return CacheKey{request.method, request.url};
}

} // namespace core
} // namespace offcache
