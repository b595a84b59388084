#ifndef OFFCACHE_LIFECYCLE_LIFECYCLE_MANAGER_H_
#define OFFCACHE_LIFECYCLE_LIFECYCLE_MANAGER_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "offcache/core/config.h"
#include "offcache/core/result.h"
#include "offcache/net/fetcher.h"
#include "offcache/store/cache_store.h"
#include "offcache/store/partition_registry.h"

namespace offcache {
namespace lifecycle {

/**
 * @brief Version lifecycle state
 */
enum class LifecycleState {
    NEW,          // Nothing attempted yet
    INSTALLING,
    INSTALLED,    // Pre-cache complete, waiting for activation
    ACTIVATING,
    ACTIVATED,    // Serving through the dispatcher
    REDUNDANT     // Install failed; may be retried
};

const char* to_string(LifecycleState state);

struct InstallReport {
    std::string partition;
    size_t precached = 0;
    bool skip_waiting = false;   // Eligible for immediate activation
};

struct ActivateReport {
    std::string version;
    std::vector<std::string> deleted;
};

/**
 * @brief Install and activate phases of one cache version
 *
 * Phases run one at a time. install() fetches every manifest path before
 * writing any of them, so a single failure leaves the app-shell partition
 * without a partial manifest. activate() is only allowed after a successful
 * install and deletes every versioned partition of a known family that
 * belongs to another version.
 */
class LifecycleManager {
public:
    LifecycleManager(std::shared_ptr<store::CacheStore> store,
                     std::shared_ptr<net::Fetcher> fetcher,
                     const core::OriginConfig& origin,
                     const core::CacheConfig& cache);

    core::Result<InstallReport> install();
    core::Result<ActivateReport> activate();

    /**
     * @brief Newest version with an installed app-shell partition
     *
     * The current version counts only if its partition holds the whole
     * manifest. Another version's manifest is unknown here; a non-empty
     * partition is enough, install writes nothing until every fetch succeeded.
     */
    std::optional<std::string> find_complete_version() const;

    LifecycleState state() const { return state_.load(); }
    bool is_active() const { return state_.load() == LifecycleState::ACTIVATED; }

    const store::PartitionRegistry& registry() const { return registry_; }

private:
    std::shared_ptr<store::CacheStore> store_;
    std::shared_ptr<net::Fetcher> fetcher_;
    core::CacheConfig cache_;
    std::string origin_;
    store::PartitionRegistry registry_;

    std::mutex phase_mutex_;
    std::atomic<LifecycleState> state_{LifecycleState::NEW};
};

} // namespace lifecycle
} // namespace offcache

#endif // OFFCACHE_LIFECYCLE_LIFECYCLE_MANAGER_H_
