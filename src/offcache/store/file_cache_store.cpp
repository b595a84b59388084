#include "offcache/store/file_cache_store.h"

#include <cctype>
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

#include "offcache/common/logger.h"

namespace offcache {
namespace store {

namespace {

constexpr char kMagic[4] = {'O', 'F', 'C', 'E'};
constexpr uint32_t kFormatVersion = 1;
constexpr const char* kEntrySuffix = ".entry";

void put_u32(std::string& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

void put_u64(std::string& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
    }
}

void put_str(std::string& out, const std::string& s) {
    put_u64(out, s.size());
    out.append(s);
}

class Reader {
public:
    explicit Reader(const std::string& data) : data_(data) {}

    bool u32(uint32_t& v) {
        if (pos_ + 4 > data_.size()) return false;
        v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
        }
        pos_ += 4;
        return true;
    }

    bool u64(uint64_t& v) {
        if (pos_ + 8 > data_.size()) return false;
        v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(static_cast<unsigned char>(data_[pos_ + i])) << (8 * i);
        }
        pos_ += 8;
        return true;
    }

    bool str(std::string& s) {
        uint64_t len = 0;
        if (!u64(len) || len > data_.size() - pos_) return false;
        s.assign(data_, pos_, static_cast<size_t>(len));
        pos_ += static_cast<size_t>(len);
        return true;
    }

    bool raw(char* out, size_t n) {
        if (pos_ + n > data_.size()) return false;
        data_.copy(out, n, pos_);
        pos_ += n;
        return true;
    }

    bool done() const { return pos_ == data_.size(); }

private:
    const std::string& data_;
    size_t pos_ = 0;
};

bool valid_partition_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

} // namespace

FileCacheStore::FileCacheStore(const core::StoreConfig& config)
    : MemoryCacheStore(config), root_(config.directory) {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        throw core::InternalError("Failed to create cache directory " + root_.string() + ": " + ec.message());
    }
    load();
}

std::string FileCacheStore::Encode(const core::CacheEntry& entry) {
    std::string out;
    out.reserve(entry_bytes(entry) + 128);
    out.append(kMagic, sizeof(kMagic));
    put_u32(out, kFormatVersion);
    put_u64(out, entry.stored_at);
    put_str(out, entry.key.method);
    put_str(out, entry.key.url);
    put_u32(out, static_cast<uint32_t>(entry.response.status));
    put_str(out, entry.response.status_text);
    put_str(out, entry.response.url);
    put_u32(out, static_cast<uint32_t>(entry.response.headers.size()));
    for (const auto& kv : entry.response.headers) {
        put_str(out, kv.first);
        put_str(out, kv.second);
    }
    put_u32(out, static_cast<uint32_t>(entry.vary.size()));
    for (const auto& kv : entry.vary) {
        put_str(out, kv.first);
        put_str(out, kv.second);
    }
    put_str(out, entry.response.body);
    return out;
}

core::Result<core::CacheEntry> FileCacheStore::Decode(const std::string& data) {
    auto corrupt = [](const char* what) {
        return core::Result<core::CacheEntry>::error(std::string("Corrupt cache entry: ") + what,
                                                     core::Error::Code::INTERNAL);
    };

    Reader in(data);
    char magic[4];
    uint32_t version = 0;
    if (!in.raw(magic, sizeof(magic)) || std::string(magic, 4) != std::string(kMagic, 4)) {
        return corrupt("bad magic");
    }
    if (!in.u32(version) || version != kFormatVersion) {
        return corrupt("unsupported format version");
    }

    core::CacheEntry entry;
    uint32_t status = 0;
    uint32_t count = 0;
    if (!in.u64(entry.stored_at) || !in.str(entry.key.method) || !in.str(entry.key.url) ||
        !in.u32(status) || !in.str(entry.response.status_text) || !in.str(entry.response.url)) {
        return corrupt("truncated header");
    }
    entry.response.status = static_cast<int>(status);

    if (!in.u32(count)) return corrupt("truncated headers");
    for (uint32_t i = 0; i < count; ++i) {
        std::string name, value;
        if (!in.str(name) || !in.str(value)) return corrupt("truncated headers");
        entry.response.headers.set(name, value);
    }
    if (!in.u32(count)) return corrupt("truncated vary");
    for (uint32_t i = 0; i < count; ++i) {
        std::string name, value;
        if (!in.str(name) || !in.str(value)) return corrupt("truncated vary");
        entry.vary[name] = value;
    }
    if (!in.str(entry.response.body) || !in.done()) {
        return corrupt("truncated body");
    }
    return entry;
}

void FileCacheStore::load() {
    std::error_code ec;
    for (const auto& dir : std::filesystem::directory_iterator(root_, ec)) {
        if (!dir.is_directory()) {
            continue;
        }
        const std::string partition = dir.path().filename().string();
        if (!valid_partition_name(partition)) {
            continue;
        }
        restore_partition(partition);

        // Newest file per key wins; older duplicates are leftovers of an interrupted overwrite
        std::map<core::CacheKey, std::pair<core::CacheEntry, std::filesystem::path>> newest;
        std::error_code file_ec;
        std::error_code rm_ec;
        for (const auto& file : std::filesystem::directory_iterator(dir.path(), file_ec)) {
            const auto& path = file.path();
            if (!file.is_regular_file()) {
                continue;
            }
            if (path.extension() != kEntrySuffix) {
                // Stray temporary file from an interrupted write
                std::filesystem::remove(path, rm_ec);
                continue;
            }
            std::ifstream in(path, std::ios::binary);
            std::stringstream buffer;
            buffer << in.rdbuf();
            auto decoded = Decode(buffer.str());
            if (!decoded.ok()) {
                OFFCACHE_WARN("Skipping {}: {}", path.string(), decoded.error());
                ++corrupt_entries_;
                continue;
            }
            core::CacheEntry entry = decoded.take_value();
            auto it = newest.find(entry.key);
            if (it == newest.end()) {
                core::CacheKey key = entry.key;
                newest.emplace(std::move(key), std::make_pair(std::move(entry), path));
            } else if (entry.stored_at > it->second.first.stored_at) {
                std::filesystem::remove(it->second.second, rm_ec);
                it->second = std::make_pair(std::move(entry), path);
            } else {
                std::filesystem::remove(path, rm_ec);
            }
        }
        if (file_ec) {
            OFFCACHE_WARN("Failed to scan partition {}: {}", partition, file_ec.message());
        }
        for (auto& kv : newest) {
            restore(partition, std::move(kv.second.first));
        }
        OFFCACHE_DEBUG("Loaded partition {} with {} entries", partition, newest.size());
    }
    if (ec) {
        OFFCACHE_WARN("Failed to scan cache directory {}: {}", root_.string(), ec.message());
    }
}

core::Result<std::filesystem::path> FileCacheStore::partition_dir(const std::string& partition) const {
    if (!valid_partition_name(partition)) {
        return core::Result<std::filesystem::path>::error("Invalid partition name: '" + partition + "'",
                                                          core::Error::Code::INVALID_ARGUMENT);
    }
    return root_ / partition;
}

std::filesystem::path FileCacheStore::entry_path(const std::filesystem::path& dir, uint64_t stored_at) const {
    char name[32];
    std::snprintf(name, sizeof(name), "%020llu", static_cast<unsigned long long>(stored_at));
    return dir / (std::string(name) + kEntrySuffix);
}

core::Result<void> FileCacheStore::on_open(const std::string& partition) {
    auto dir = partition_dir(partition);
    if (!dir.ok()) {
        return core::Result<void>::forward(dir);
    }
    std::error_code ec;
    std::filesystem::create_directories(dir.value(), ec);
    if (ec) {
        return core::Result<void>::error("Failed to create partition directory: " + ec.message(),
                                         core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<void> FileCacheStore::on_put(const std::string& partition,
                                          const core::CacheEntry& entry,
                                          const core::CacheEntry* replaced) {
    auto dir = partition_dir(partition);
    if (!dir.ok()) {
        return core::Result<void>::forward(dir);
    }
    const auto final_path = entry_path(dir.value(), entry.stored_at);
    auto tmp_path = final_path;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Result<void>::error("Failed to open " + tmp_path.string(),
                                             core::Error::Code::INTERNAL);
        }
        const std::string data = Encode(entry);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out.good()) {
            std::error_code ignored;
            std::filesystem::remove(tmp_path, ignored);
            // A short write on a full disk is the file-backed quota condition
            return core::Result<void>::error("Failed to write " + tmp_path.string(),
                                             core::Error::Code::RESOURCE_EXHAUSTED);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, final_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return core::Result<void>::error("Failed to commit " + final_path.string() + ": " + ec.message(),
                                         core::Error::Code::INTERNAL);
    }
    if (replaced) {
        std::filesystem::remove(entry_path(dir.value(), replaced->stored_at), ec);
        if (ec) {
            // The newer file wins on the next load
            OFFCACHE_WARN("Failed to remove superseded entry in {}: {}", partition, ec.message());
        }
    }
    return core::Result<void>();
}

core::Result<void> FileCacheStore::on_remove(const std::string& partition, const core::CacheEntry& entry) {
    auto dir = partition_dir(partition);
    if (!dir.ok()) {
        return core::Result<void>::forward(dir);
    }
    std::error_code ec;
    std::filesystem::remove(entry_path(dir.value(), entry.stored_at), ec);
    if (ec) {
        return core::Result<void>::error("Failed to remove entry: " + ec.message(), core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

core::Result<void> FileCacheStore::on_drop(const std::string& partition) {
    auto dir = partition_dir(partition);
    if (!dir.ok()) {
        return core::Result<void>::forward(dir);
    }
    std::error_code ec;
    std::filesystem::remove_all(dir.value(), ec);
    if (ec) {
        return core::Result<void>::error("Failed to remove partition " + partition + ": " + ec.message(),
                                         core::Error::Code::INTERNAL);
    }
    return core::Result<void>();
}

} // namespace store
} // namespace offcache
