#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "offcache/core/types.h"

namespace offcache {
namespace store {

/**
 * @brief A partition name split into its family and version
 */
struct PartitionName {
    core::PartitionFamily family;
    std::string version;
    std::string name;
};

/**
 * @brief Maps partition names to resource families for one current version
 *
 * A name belongs to a family only if it is exactly `<family>-<version>` where
 * the version satisfies core::is_valid_version(). Every other name is foreign
 * and is never selected for deletion, so `api-cache-v1` or `dynamic-backup`
 * survive version transitions and cleanups untouched.
 */
class PartitionRegistry {
public:
    using Index = std::map<core::PartitionFamily, std::set<std::string>>;

    explicit PartitionRegistry(std::string current_version);

    const std::string& version() const { return version_; }

    /// Name of the family's partition for the current version
    std::string current(core::PartitionFamily family) const;

    static std::string compose(core::PartitionFamily family, const std::string& version);
    static std::optional<PartitionName> parse(const std::string& name);

    /// Known families to the versioned partition names present in `names`
    static Index index(const std::vector<std::string>& names);

    /// Names of a known family whose version differs from the current one
    std::vector<std::string> stale(const std::vector<std::string>& names) const;

    /// Names of any version that belong to one family
    static std::vector<std::string> members(const std::vector<std::string>& names,
                                            core::PartitionFamily family);

private:
    std::string version_;
};

} // namespace store
} // namespace offcache
