#include "offcache/lifecycle/lifecycle_manager.h"

#include <algorithm>
#include <utility>

#include "offcache/common/logger.h"
#include "offcache/common/url.h"
#include "offcache/core/error.h"

namespace offcache {
namespace lifecycle {

const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::NEW: return "new";
        case LifecycleState::INSTALLING: return "installing";
        case LifecycleState::INSTALLED: return "installed";
        case LifecycleState::ACTIVATING: return "activating";
        case LifecycleState::ACTIVATED: return "activated";
        case LifecycleState::REDUNDANT: return "redundant";
    }
    return "unknown";
}

LifecycleManager::LifecycleManager(std::shared_ptr<store::CacheStore> store,
                                   std::shared_ptr<net::Fetcher> fetcher,
                                   const core::OriginConfig& origin,
                                   const core::CacheConfig& cache)
    : store_(std::move(store)),
      fetcher_(std::move(fetcher)),
      cache_(cache),
      registry_(cache.version) {
    auto url = common::Url::Parse(origin.origin);
    if (!url || !url->is_http()) {
        throw core::InvalidArgumentError("Origin must be an http(s) URL: '" + origin.origin + "'");
    }
    origin_ = url->origin();
}

core::Result<InstallReport> LifecycleManager::install() {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    auto current = state_.load();
    if (current != LifecycleState::NEW && current != LifecycleState::REDUNDANT) {
        return core::Result<InstallReport>::error(
            std::string("Cannot install in state ") + to_string(current),
            core::Error::Code::ALREADY_EXISTS);
    }
    state_.store(LifecycleState::INSTALLING);

    InstallReport report;
    report.partition = registry_.current(core::PartitionFamily::APP_SHELL);
    OFFCACHE_INFO("Installing cache version {}: pre-caching {} paths into {}",
                  registry_.version(), cache_.precache_manifest.size(), report.partition);

    auto fail = [this](const std::string& message, core::Error::Code code) {
        state_.store(LifecycleState::REDUNDANT);
        OFFCACHE_ERROR("Install of cache version {} failed: {}", registry_.version(), message);
        return core::Result<InstallReport>::error(message, code);
    };

    auto opened = store_->open(report.partition);
    if (!opened.ok()) {
        return fail(opened.error(), opened.error_code());
    }

    std::vector<std::pair<core::Request, core::Response>> fetched;
    fetched.reserve(cache_.precache_manifest.size());
    for (const auto& path : cache_.precache_manifest) {
        auto request = core::Request::Get(origin_ + path);
        auto result = fetcher_->fetch(request);
        if (!result.ok()) {
            return fail("Fetching " + request.url + ": " + result.error(), result.error_code());
        }
        if (!result.value().ok()) {
            return fail("Fetching " + request.url + ": status " + std::to_string(result.value().status),
                        core::Error::Code::UNAVAILABLE);
        }
        fetched.emplace_back(std::move(request), result.take_value());
    }

    for (const auto& item : fetched) {
        auto stored = store_->put(report.partition, item.first, item.second);
        if (!stored.ok()) {
            return fail("Storing " + item.first.url + ": " + stored.error(), stored.error_code());
        }
        ++report.precached;
    }

    report.skip_waiting = cache_.skip_waiting_on_install;
    state_.store(LifecycleState::INSTALLED);
    OFFCACHE_INFO("Installed cache version {} ({} entries)", registry_.version(), report.precached);
    return report;
}

core::Result<ActivateReport> LifecycleManager::activate() {
    std::lock_guard<std::mutex> lock(phase_mutex_);
    auto current = state_.load();
    if (current != LifecycleState::INSTALLED) {
        return core::Result<ActivateReport>::error(
            std::string("Cannot activate in state ") + to_string(current),
            core::Error::Code::INVALID_ARGUMENT);
    }
    state_.store(LifecycleState::ACTIVATING);

    ActivateReport report;
    report.version = registry_.version();
    for (const auto& name : registry_.stale(store_->partitions())) {
        auto dropped = store_->drop_partition(name);
        if (!dropped.ok()) {
            // Stay installed so activation can be retried
            state_.store(LifecycleState::INSTALLED);
            OFFCACHE_ERROR("Activation of cache version {} failed deleting {}: {}",
                           report.version, name, dropped.error());
            return core::Result<ActivateReport>::forward(dropped);
        }
        if (dropped.value()) {
            OFFCACHE_INFO("Deleted old cache partition {}", name);
            report.deleted.push_back(name);
        }
    }

    state_.store(LifecycleState::ACTIVATED);
    OFFCACHE_INFO("Activated cache version {} ({} old partitions deleted)",
                  report.version, report.deleted.size());
    return report;
}

std::optional<std::string> LifecycleManager::find_complete_version() const {
    std::vector<std::string> versions;
    for (const auto& name : store::PartitionRegistry::members(store_->partitions(),
                                                               core::PartitionFamily::APP_SHELL)) {
        auto parsed = store::PartitionRegistry::parse(name);
        if (parsed) {
            versions.push_back(parsed->version);
        }
    }
    std::sort(versions.begin(), versions.end(), [](const std::string& a, const std::string& b) {
        return core::compare_versions(a, b) > 0;
    });

    for (const auto& version : versions) {
        const auto partition = store::PartitionRegistry::compose(core::PartitionFamily::APP_SHELL, version);
        bool complete = false;
        if (version == registry_.version()) {
            complete = std::all_of(cache_.precache_manifest.begin(), cache_.precache_manifest.end(),
                [&](const std::string& path) {
                    return store_->match(partition, core::Request::Get(origin_ + path)).has_value();
                });
        } else {
            complete = store_->size(partition) > 0;
        }
        if (complete) {
            return version;
        }
        OFFCACHE_DEBUG("Partition {} is not a complete install", partition);
    }
    return std::nullopt;
}

} // namespace lifecycle
} // namespace offcache
