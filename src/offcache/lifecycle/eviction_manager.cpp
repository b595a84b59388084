#include "offcache/lifecycle/eviction_manager.h"

#include "offcache/common/logger.h"

namespace offcache {
namespace lifecycle {

EvictionManager::EvictionManager(std::shared_ptr<store::CacheStore> store,
                                 store::PartitionRegistry registry,
                                 size_t image_max_entries)
    : store_(std::move(store)),
      registry_(std::move(registry)),
      image_max_entries_(image_max_entries) {
}

core::Result<CleanupReport> EvictionManager::cleanup() {
    std::lock_guard<std::mutex> lock(cleanup_mutex_);
    CleanupReport report;

    auto purged = purge_dynamic();
    if (!purged.ok()) {
        return core::Result<CleanupReport>::forward(purged);
    }
    report.purged_partitions = purged.take_value();

    auto pruned = prune_images();
    if (!pruned.ok()) {
        return core::Result<CleanupReport>::forward(pruned);
    }
    report.pruned_entries = pruned.value();
    report.image_entries = store_->size(registry_.current(core::PartitionFamily::IMAGE));

    OFFCACHE_INFO("Cleanup: purged {} dynamic partitions, pruned {} images, {} images kept",
                  report.purged_partitions.size(), report.pruned_entries, report.image_entries);
    return report;
}

core::Result<std::vector<std::string>> EvictionManager::purge_dynamic() {
    std::vector<std::string> purged;
    auto names = store::PartitionRegistry::members(store_->partitions(), core::PartitionFamily::DYNAMIC);
    for (const auto& name : names) {
        auto dropped = store_->drop_partition(name);
        if (!dropped.ok()) {
            return core::Result<std::vector<std::string>>::forward(dropped);
        }
        if (dropped.value()) {
            OFFCACHE_DEBUG("Purged dynamic partition {}", name);
            purged.push_back(name);
        }
    }
    return purged;
}

core::Result<size_t> EvictionManager::prune_images() {
    auto partition = registry_.current(core::PartitionFamily::IMAGE);
    auto entries = store_->entries(partition);
    if (entries.size() <= image_max_entries_) {
        return size_t(0);
    }

    size_t excess = entries.size() - image_max_entries_;
    size_t removed = 0;
    for (size_t i = 0; i < excess; ++i) {
        // An entry refreshed since the snapshot is no longer among the oldest
        auto result = store_->remove_if_stored_at(partition, entries[i].key, entries[i].stored_at);
        if (!result.ok()) {
            return core::Result<size_t>::forward(result);
        }
        if (result.value()) {
            ++removed;
        }
    }
    OFFCACHE_DEBUG("Pruned {} of {} entries from {}", removed, entries.size(), partition);
    return removed;
}

} // namespace lifecycle
} // namespace offcache
