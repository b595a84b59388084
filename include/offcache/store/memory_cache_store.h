#pragma once

#include <atomic>
#include <map>
#include <shared_mutex>
#include <string>

#include "offcache/core/config.h"
#include "offcache/store/cache_store.h"

namespace offcache {
namespace store {

/**
 * @brief Thread-safe in-memory CacheStore
 *
 * All partitions share one reader/writer lock. An optional quota on the total
 * number of entries and on their approximate byte size makes writes fail with
 * RESOURCE_EXHAUSTED once reached; nothing is evicted implicitly.
 *
 * Subclasses can persist mutations through the protected hooks, which run
 * under the write lock before the in-memory state changes. A failing hook
 * aborts the mutation.
 */
class MemoryCacheStore : public CacheStore {
public:
    explicit MemoryCacheStore(const core::StoreConfig& config = core::StoreConfig{});
    ~MemoryCacheStore() override = default;

    MemoryCacheStore(const MemoryCacheStore&) = delete;
    MemoryCacheStore& operator=(const MemoryCacheStore&) = delete;

    core::Result<void> open(const std::string& partition) override;
    bool has_partition(const std::string& partition) const override;
    std::vector<std::string> partitions() const override;
    core::Result<bool> drop_partition(const std::string& partition) override;

    core::Result<void> put(const std::string& partition,
                           const core::Request& request,
                           const core::Response& response) override;
    std::optional<core::Response> match(const std::string& partition,
                                        const core::Request& request) const override;
    core::Result<bool> remove(const std::string& partition, const core::CacheKey& key) override;
    core::Result<bool> remove_if_stored_at(const std::string& partition,
                                           const core::CacheKey& key,
                                           uint64_t stored_at) override;
    std::vector<core::CacheEntry> entries(const std::string& partition) const override;
    size_t size(const std::string& partition) const override;

    size_t total_entries() const;
    uint64_t total_bytes() const;
    uint64_t hit_count() const { return hit_count_.load(); }
    uint64_t miss_count() const { return miss_count_.load(); }

protected:
    struct Partition {
        std::map<core::CacheKey, core::CacheEntry> entries;
        uint64_t bytes = 0;
    };

    virtual core::Result<void> on_open(const std::string& /*partition*/) { return core::Result<void>(); }
    virtual core::Result<void> on_put(const std::string& /*partition*/,
                                      const core::CacheEntry& /*entry*/,
                                      const core::CacheEntry* /*replaced*/) { return core::Result<void>(); }
    virtual core::Result<void> on_remove(const std::string& /*partition*/,
                                         const core::CacheEntry& /*entry*/) { return core::Result<void>(); }
    virtual core::Result<void> on_drop(const std::string& /*partition*/) { return core::Result<void>(); }

    /**
     * @brief Insert an already persisted entry while loading; caller holds no lock
     */
    void restore(const std::string& partition, core::CacheEntry entry);
    void restore_partition(const std::string& partition);

private:
    core::Result<bool> remove_locked(const std::string& partition,
                                     const core::CacheKey& key,
                                     const uint64_t* stored_at);

    core::StoreConfig config_;
    mutable std::shared_mutex mutex_;
    std::map<std::string, Partition> partitions_;
    uint64_t next_stored_at_ = 1;
    size_t total_entries_ = 0;
    uint64_t total_bytes_ = 0;

    mutable std::atomic<uint64_t> hit_count_{0};
    mutable std::atomic<uint64_t> miss_count_{0};
};

} // namespace store
} // namespace offcache
