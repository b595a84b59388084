#include "offcache/routing/request_classifier.h"

#include "offcache/core/error.h"

namespace offcache {
namespace routing {

namespace {

bool starts_with(const std::string& s, const std::string& prefix) {
    return !prefix.empty() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

RequestClassifier::RequestClassifier(const core::OriginConfig& config) : config_(config) {
    auto origin = common::Url::Parse(config.origin);
    if (!origin || !origin->is_http()) {
        throw core::InvalidArgumentError("Origin must be an http(s) URL: '" + config.origin + "'");
    }
    origin_ = origin->origin();

    for (const auto& host : config.api_hosts) {
        api_hosts_.insert(common::to_lower(host));
    }
    for (const auto& host : config.image_hosts) {
        image_hosts_.insert(common::to_lower(host));
    }
    for (const auto& ext : config.image_extensions) {
        image_extensions_.insert(common::to_lower(ext));
    }
}

bool RequestClassifier::host_listed(const std::set<std::string>& hosts, const common::Url& url) {
    return hosts.count(url.host()) > 0 || hosts.count(url.host_port()) > 0;
}

std::optional<core::Classification> RequestClassifier::classify(const core::Request& request) const {
    if (!request.is_get()) {
        return std::nullopt;
    }
    auto url = common::Url::Parse(request.url);
    if (!url || !url->is_http()) {
        return std::nullopt;
    }

    if (starts_with(url->path(), config_.api_prefix) || host_listed(api_hosts_, *url)) {
        return core::Classification::API;
    }
    if (host_listed(image_hosts_, *url) || image_extensions_.count(url->extension()) > 0) {
        return core::Classification::IMAGE;
    }
    if (starts_with(url->path(), config_.static_prefix)) {
        return core::Classification::STATIC_ASSET;
    }
    if (common::to_lower(request.accept()).find("text/html") != std::string::npos) {
        return core::Classification::HTML_NAVIGATION;
    }
    return core::Classification::DYNAMIC;
}

bool RequestClassifier::in_scope(const core::Request& request) const {
    if (!request.is_get()) {
        return false;
    }
    auto url = common::Url::Parse(request.url);
    if (!url || !url->is_http()) {
        return false;
    }
    return url->origin() == origin_ || host_listed(api_hosts_, *url) || host_listed(image_hosts_, *url);
}

} // namespace routing
} // namespace offcache
