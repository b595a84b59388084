#pragma once

#include <filesystem>
#include <string>

#include "offcache/store/memory_cache_store.h"

namespace offcache {
namespace store {

/**
 * @brief CacheStore persisted on the local filesystem
 *
 * Layout: one directory per partition under the root, one file per entry
 * named after its stored_at counter. Entries are written to a temporary file
 * and renamed into place, so a crash never leaves a half-written entry. The
 * whole cache is loaded into memory on construction and reads are served
 * from there; every mutation is written through before it becomes visible.
 */
class FileCacheStore : public MemoryCacheStore {
public:
    /**
     * @brief Open (or create) the store rooted at config.directory
     * @throws core::InternalError if the root directory cannot be created
     */
    explicit FileCacheStore(const core::StoreConfig& config);
    ~FileCacheStore() override = default;

    const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Number of entry files skipped during load because they were unreadable
     */
    size_t corrupt_entries() const { return corrupt_entries_; }

    /**
     * @brief Encode an entry in the on-disk format
     */
    static std::string Encode(const core::CacheEntry& entry);

    /**
     * @brief Decode the on-disk format
     * @return The entry, or an INTERNAL error for truncated or foreign data
     */
    static core::Result<core::CacheEntry> Decode(const std::string& data);

protected:
    core::Result<void> on_open(const std::string& partition) override;
    core::Result<void> on_put(const std::string& partition,
                              const core::CacheEntry& entry,
                              const core::CacheEntry* replaced) override;
    core::Result<void> on_remove(const std::string& partition,
                                 const core::CacheEntry& entry) override;
    core::Result<void> on_drop(const std::string& partition) override;

private:
    void load();
    core::Result<std::filesystem::path> partition_dir(const std::string& partition) const;
    std::filesystem::path entry_path(const std::filesystem::path& dir, uint64_t stored_at) const;

    std::filesystem::path root_;
    size_t corrupt_entries_ = 0;
};

} // namespace store
} // namespace offcache
