#include "offcache/store/memory_cache_store.h"

#include <algorithm>
#include <mutex>

#include "offcache/common/logger.h"

namespace offcache {
namespace store {

MemoryCacheStore::MemoryCacheStore(const core::StoreConfig& config)
    : config_(config) {
}

core::Result<void> MemoryCacheStore::open(const std::string& partition) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (partitions_.count(partition)) {
        return core::Result<void>();
    }
    auto hooked = on_open(partition);
    if (!hooked.ok()) {
        return hooked;
    }
    partitions_.emplace(partition, Partition{});
    return core::Result<void>();
}

bool MemoryCacheStore::has_partition(const std::string& partition) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return partitions_.count(partition) > 0;
}

std::vector<std::string> MemoryCacheStore::partitions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(partitions_.size());
    for (const auto& kv : partitions_) {
        names.push_back(kv.first);
    }
    return names;
}

core::Result<bool> MemoryCacheStore::drop_partition(const std::string& partition) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = partitions_.find(partition);
    if (it == partitions_.end()) {
        return false;
    }
    auto hooked = on_drop(partition);
    if (!hooked.ok()) {
        return core::Result<bool>::forward(hooked);
    }
    total_entries_ -= it->second.entries.size();
    total_bytes_ -= it->second.bytes;
    partitions_.erase(it);
    return true;
}

core::Result<void> MemoryCacheStore::put(const std::string& partition,
                                         const core::Request& request,
                                         const core::Response& response) {
    auto made = make_entry(request, response);
    if (!made.ok()) {
        return core::Result<void>::forward(made);
    }
    core::CacheEntry entry = made.take_value();
    const uint64_t bytes = entry_bytes(entry);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto pit = partitions_.find(partition);
    const core::CacheEntry* replaced = nullptr;
    if (pit != partitions_.end()) {
        auto eit = pit->second.entries.find(entry.key);
        if (eit != pit->second.entries.end()) {
            replaced = &eit->second;
        }
    }

    size_t entries_after = total_entries_ + (replaced ? 0 : 1);
    uint64_t bytes_after = total_bytes_ + bytes - (replaced ? entry_bytes(*replaced) : 0);
    if (config_.max_entries > 0 && entries_after > config_.max_entries) {
        return core::Result<void>::error("Cache quota exceeded: entry limit " +
                                             std::to_string(config_.max_entries),
                                         core::Error::Code::RESOURCE_EXHAUSTED);
    }
    if (config_.max_bytes > 0 && bytes_after > config_.max_bytes) {
        return core::Result<void>::error("Cache quota exceeded: byte limit " +
                                             std::to_string(config_.max_bytes),
                                         core::Error::Code::RESOURCE_EXHAUSTED);
    }

    entry.stored_at = next_stored_at_;
    const bool created = pit == partitions_.end();
    if (created) {
        auto opened = on_open(partition);
        if (!opened.ok()) {
            return opened;
        }
    }
    auto hooked = on_put(partition, entry, replaced);
    if (!hooked.ok()) {
        if (created) {
            // The partition never became visible; do not leave it persisted
            auto undone = on_drop(partition);
            if (!undone.ok()) {
                OFFCACHE_WARN("Could not remove partition {} after a failed write: {}",
                              partition, undone.error());
            }
        }
        return hooked;
    }

    ++next_stored_at_;
    auto& target = partitions_[partition];
    if (replaced) {
        target.bytes -= entry_bytes(*replaced);
    }
    target.bytes += bytes;
    target.entries[entry.key] = std::move(entry);
    total_entries_ = entries_after;
    total_bytes_ = bytes_after;
    return core::Result<void>();
}

std::optional<core::Response> MemoryCacheStore::match(const std::string& partition,
                                                      const core::Request& request) const {
    auto key = core::CacheKey::for_request(request);
    if (!key) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto pit = partitions_.find(partition);
    if (pit != partitions_.end()) {
        auto eit = pit->second.entries.find(*key);
        if (eit != pit->second.entries.end() && vary_matches(eit->second, request)) {
            hit_count_.fetch_add(1, std::memory_order_relaxed);
            return eit->second.response;
        }
    }
    miss_count_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
}

core::Result<bool> MemoryCacheStore::remove(const std::string& partition, const core::CacheKey& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return remove_locked(partition, key, nullptr);
}

core::Result<bool> MemoryCacheStore::remove_if_stored_at(const std::string& partition,
                                                         const core::CacheKey& key,
                                                         uint64_t stored_at) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return remove_locked(partition, key, &stored_at);
}

core::Result<bool> MemoryCacheStore::remove_locked(const std::string& partition,
                                                   const core::CacheKey& key,
                                                   const uint64_t* stored_at) {
    auto pit = partitions_.find(partition);
    if (pit == partitions_.end()) {
        return false;
    }
    auto eit = pit->second.entries.find(key);
    if (eit == pit->second.entries.end()) {
        return false;
    }
    if (stored_at && eit->second.stored_at != *stored_at) {
        return false;
    }
    auto hooked = on_remove(partition, eit->second);
    if (!hooked.ok()) {
        return core::Result<bool>::forward(hooked);
    }
    const uint64_t bytes = entry_bytes(eit->second);
    pit->second.bytes -= bytes;
    total_bytes_ -= bytes;
    --total_entries_;
    pit->second.entries.erase(eit);
    return true;
}

std::vector<core::CacheEntry> MemoryCacheStore::entries(const std::string& partition) const {
    std::vector<core::CacheEntry> out;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto pit = partitions_.find(partition);
        if (pit == partitions_.end()) {
            return out;
        }
        out.reserve(pit->second.entries.size());
        for (const auto& kv : pit->second.entries) {
            out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), [](const core::CacheEntry& a, const core::CacheEntry& b) {
        return a.stored_at < b.stored_at;
    });
    return out;
}

size_t MemoryCacheStore::size(const std::string& partition) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto pit = partitions_.find(partition);
    return pit == partitions_.end() ? 0 : pit->second.entries.size();
}

size_t MemoryCacheStore::total_entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return total_entries_;
}

uint64_t MemoryCacheStore::total_bytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return total_bytes_;
}

void MemoryCacheStore::restore_partition(const std::string& partition) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    partitions_[partition];
}

void MemoryCacheStore::restore(const std::string& partition, core::CacheEntry entry) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& target = partitions_[partition];
    next_stored_at_ = std::max(next_stored_at_, entry.stored_at + 1);
    const uint64_t bytes = entry_bytes(entry);
    auto eit = target.entries.find(entry.key);
    if (eit != target.entries.end()) {
        // Two files for one key: keep the newer write
        if (eit->second.stored_at > entry.stored_at) {
            return;
        }
        const uint64_t old_bytes = entry_bytes(eit->second);
        target.bytes -= old_bytes;
        total_bytes_ -= old_bytes;
        --total_entries_;
    }
    target.bytes += bytes;
    total_bytes_ += bytes;
    ++total_entries_;
    target.entries[entry.key] = std::move(entry);
}

} // namespace store
} // namespace offcache
