#ifndef OFFCACHE_LIFECYCLE_EVICTION_MANAGER_H_
#define OFFCACHE_LIFECYCLE_EVICTION_MANAGER_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "offcache/core/result.h"
#include "offcache/store/cache_store.h"
#include "offcache/store/partition_registry.h"

namespace offcache {
namespace lifecycle {

struct CleanupReport {
    std::vector<std::string> purged_partitions;
    size_t pruned_entries = 0;
    size_t image_entries = 0;    // Left in the image partition afterwards
};

/**
 * @brief On-demand storage reclamation
 *
 * cleanup() deletes every versioned dynamic partition outright, then keeps
 * only the most recently written entries of the current image partition.
 * Both steps are idempotent. Requests keep being served while it runs.
 */
class EvictionManager {
public:
    EvictionManager(std::shared_ptr<store::CacheStore> store,
                    store::PartitionRegistry registry,
                    size_t image_max_entries);

    core::Result<CleanupReport> cleanup();

    /// Delete all dynamic partitions, any version
    core::Result<std::vector<std::string>> purge_dynamic();

    /// Remove the oldest image entries beyond the capacity
    core::Result<size_t> prune_images();

    size_t image_max_entries() const { return image_max_entries_; }

private:
    std::shared_ptr<store::CacheStore> store_;
    store::PartitionRegistry registry_;
    size_t image_max_entries_;
    std::mutex cleanup_mutex_;
};

} // namespace lifecycle
} // namespace offcache

#endif // OFFCACHE_LIFECYCLE_EVICTION_MANAGER_H_
