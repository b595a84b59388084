#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "offcache/core/result.h"
#include "offcache/core/types.h"

namespace offcache {
namespace store {

/**
 * @brief Persistence of responses in named partitions
 *
 * Implementations must be safe for concurrent use by many in-flight
 * requests; put, match and remove are atomic per key. Writes enforce the
 * storage invariants: only GET requests and ok responses are ever stored.
 */
class CacheStore {
public:
    virtual ~CacheStore() = default;

    /**
     * @brief Create the partition if it does not exist yet
     */
    virtual core::Result<void> open(const std::string& partition) = 0;

    virtual bool has_partition(const std::string& partition) const = 0;

    /**
     * @brief Names of all partitions, in lexicographic order
     */
    virtual std::vector<std::string> partitions() const = 0;

    /**
     * @brief Delete a partition and every entry in it
     * @return true if the partition existed
     */
    virtual core::Result<bool> drop_partition(const std::string& partition) = 0;

    /**
     * @brief Store a copy of a response, replacing any entry with the same key
     *
     * The partition is created lazily. Fails with INVALID_ARGUMENT for non-GET
     * requests, non-ok responses and `Vary: *`; with RESOURCE_EXHAUSTED when a
     * quota would be exceeded.
     */
    virtual core::Result<void> put(const std::string& partition,
                                   const core::Request& request,
                                   const core::Response& response) = 0;

    /**
     * @brief Find the stored response for a request, honouring Vary
     */
    virtual std::optional<core::Response> match(const std::string& partition,
                                                const core::Request& request) const = 0;

    /**
     * @return true if an entry was removed
     */
    virtual core::Result<bool> remove(const std::string& partition, const core::CacheKey& key) = 0;

    /**
     * @brief Remove an entry only if it was not rewritten since it was read
     * @return true if the entry with exactly this stored_at was removed
     */
    virtual core::Result<bool> remove_if_stored_at(const std::string& partition,
                                                   const core::CacheKey& key,
                                                   uint64_t stored_at) = 0;

    /**
     * @brief All entries of a partition ordered by ascending stored_at (oldest first)
     */
    virtual std::vector<core::CacheEntry> entries(const std::string& partition) const = 0;

    virtual size_t size(const std::string& partition) const = 0;
};

/**
 * @brief Validate a write and build the entry that would be stored
 *
 * Shared by the store implementations; stored_at is left at 0.
 */
core::Result<core::CacheEntry> make_entry(const core::Request& request,
                                          const core::Response& response);

/**
 * @brief Whether a stored entry may answer a request under its Vary rules
 */
bool vary_matches(const core::CacheEntry& entry, const core::Request& request);

/**
 * @brief Approximate footprint of an entry, used for byte quotas
 */
uint64_t entry_bytes(const core::CacheEntry& entry);

} // namespace store
} // namespace offcache
