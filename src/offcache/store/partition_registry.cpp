#include "offcache/store/partition_registry.h"

#include "offcache/core/config.h"
#include "offcache/core/error.h"

namespace offcache {
namespace store {

PartitionRegistry::PartitionRegistry(std::string current_version)
    : version_(std::move(current_version)) {
    if (!core::is_valid_version(version_)) {
        throw core::InvalidArgumentError("Invalid cache version: '" + version_ + "'");
    }
}

std::string PartitionRegistry::current(core::PartitionFamily family) const {
    return compose(family, version_);
}

std::string PartitionRegistry::compose(core::PartitionFamily family, const std::string& version) {
    return std::string(core::family_name(family)) + "-" + version;
}

std::optional<PartitionName> PartitionRegistry::parse(const std::string& name) {
    for (auto family : core::kAllFamilies) {
        const std::string prefix = std::string(core::family_name(family)) + "-";
        if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string version = name.substr(prefix.size());
        if (core::is_valid_version(version)) {
            return PartitionName{family, std::move(version), name};
        }
    }
    return std::nullopt;
}

PartitionRegistry::Index PartitionRegistry::index(const std::vector<std::string>& names) {
    Index idx;
    for (const auto& name : names) {
        auto parsed = parse(name);
        if (parsed) {
            idx[parsed->family].insert(parsed->name);
        }
    }
    return idx;
}

std::vector<std::string> PartitionRegistry::stale(const std::vector<std::string>& names) const {
    std::vector<std::string> out;
    for (const auto& kv : index(names)) {
        const std::string keep = current(kv.first);
        for (const auto& name : kv.second) {
            if (name != keep) {
                out.push_back(name);
            }
        }
    }
    return out;
}

std::vector<std::string> PartitionRegistry::members(const std::vector<std::string>& names,
                                                    core::PartitionFamily family) {
    auto idx = index(names);
    auto it = idx.find(family);
    if (it == idx.end()) {
        return {};
    }
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

} // namespace store
} // namespace offcache
