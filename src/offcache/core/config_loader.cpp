#include "offcache/core/config_loader.h"

#include <fstream>
#include <functional>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace offcache {
namespace core {

namespace {

Result<void> type_error(const std::string& field, const char* expected) {
    return Result<void>::error("Config field '" + field + "' must be " + expected,
                               Error::Code::INVALID_ARGUMENT);
}

Result<void> read_string(const rapidjson::Value& obj, const char* name,
                         const std::string& section, std::string& out) {
    if (!obj.HasMember(name)) return Result<void>();
    const auto& v = obj[name];
    if (!v.IsString()) return type_error(section + "." + name, "a string");
    out.assign(v.GetString(), v.GetStringLength());
    return Result<void>();
}

Result<void> read_string_list(const rapidjson::Value& obj, const char* name,
                              const std::string& section, std::vector<std::string>& out) {
    if (!obj.HasMember(name)) return Result<void>();
    const auto& v = obj[name];
    if (!v.IsArray()) return type_error(section + "." + name, "an array of strings");
    std::vector<std::string> values;
    for (const auto& item : v.GetArray()) {
        if (!item.IsString()) return type_error(section + "." + name, "an array of strings");
        values.emplace_back(item.GetString(), item.GetStringLength());
    }
    out = std::move(values);
    return Result<void>();
}

template<typename T>
Result<void> read_uint(const rapidjson::Value& obj, const char* name,
                       const std::string& section, T& out) {
    if (!obj.HasMember(name)) return Result<void>();
    const auto& v = obj[name];
    if (!v.IsUint64()) return type_error(section + "." + name, "a non-negative integer");
    out = static_cast<T>(v.GetUint64());
    return Result<void>();
}

Result<void> read_ms(const rapidjson::Value& obj, const char* name,
                     const std::string& section, std::chrono::milliseconds& out) {
    uint64_t ms = static_cast<uint64_t>(out.count());
    auto r = read_uint(obj, name, section, ms);
    if (!r.ok()) return r;
    out = std::chrono::milliseconds(ms);
    return Result<void>();
}

Result<void> read_bool(const rapidjson::Value& obj, const char* name,
                       const std::string& section, bool& out) {
    if (!obj.HasMember(name)) return Result<void>();
    const auto& v = obj[name];
    if (!v.IsBool()) return type_error(section + "." + name, "a boolean");
    out = v.GetBool();
    return Result<void>();
}

#define OFFCACHE_CONFIG_READ(expr)          \
    do {                                    \
        auto _r = (expr);                   \
        if (!_r.ok()) return _r;            \
    } while (0)

Result<void> load_origin(const rapidjson::Value& obj, OriginConfig& c) {
    const std::string s = "origin";
    OFFCACHE_CONFIG_READ(read_string(obj, "origin", s, c.origin));
    OFFCACHE_CONFIG_READ(read_string_list(obj, "api_hosts", s, c.api_hosts));
    OFFCACHE_CONFIG_READ(read_string_list(obj, "image_hosts", s, c.image_hosts));
    OFFCACHE_CONFIG_READ(read_string(obj, "api_prefix", s, c.api_prefix));
    OFFCACHE_CONFIG_READ(read_string(obj, "static_prefix", s, c.static_prefix));
    OFFCACHE_CONFIG_READ(read_string_list(obj, "image_extensions", s, c.image_extensions));
    return Result<void>();
}

Result<void> load_cache(const rapidjson::Value& obj, CacheConfig& c) {
    const std::string s = "cache";
    OFFCACHE_CONFIG_READ(read_string(obj, "version", s, c.version));
    OFFCACHE_CONFIG_READ(read_string_list(obj, "precache_manifest", s, c.precache_manifest));
    OFFCACHE_CONFIG_READ(read_string(obj, "offline_page", s, c.offline_page));
    OFFCACHE_CONFIG_READ(read_string(obj, "offline_text", s, c.offline_text));
    OFFCACHE_CONFIG_READ(read_ms(obj, "api_timeout_ms", s, c.api_timeout));
    OFFCACHE_CONFIG_READ(read_ms(obj, "navigation_timeout_ms", s, c.navigation_timeout));
    OFFCACHE_CONFIG_READ(read_uint(obj, "image_max_entries", s, c.image_max_entries));
    OFFCACHE_CONFIG_READ(read_bool(obj, "skip_waiting_on_install", s, c.skip_waiting_on_install));
    OFFCACHE_CONFIG_READ(read_ms(obj, "install_retry_ms", s, c.install_retry_interval));
    return Result<void>();
}

Result<void> load_store(const rapidjson::Value& obj, StoreConfig& c) {
    const std::string s = "store";
    OFFCACHE_CONFIG_READ(read_string(obj, "backend", s, c.backend));
    OFFCACHE_CONFIG_READ(read_string(obj, "directory", s, c.directory));
    OFFCACHE_CONFIG_READ(read_uint(obj, "max_entries", s, c.max_entries));
    OFFCACHE_CONFIG_READ(read_uint(obj, "max_bytes", s, c.max_bytes));
    return Result<void>();
}

Result<void> load_fetcher(const rapidjson::Value& obj, FetcherConfig& c) {
    const std::string s = "fetcher";
    OFFCACHE_CONFIG_READ(read_ms(obj, "connect_timeout_ms", s, c.connect_timeout));
    OFFCACHE_CONFIG_READ(read_ms(obj, "read_timeout_ms", s, c.read_timeout));
    OFFCACHE_CONFIG_READ(read_string(obj, "user_agent", s, c.user_agent));
    return Result<void>();
}

Result<void> load_server(const rapidjson::Value& obj, ServerConfig& c) {
    const std::string s = "server";
    OFFCACHE_CONFIG_READ(read_string(obj, "listen_address", s, c.listen_address));
    OFFCACHE_CONFIG_READ(read_uint(obj, "port", s, c.port));
    OFFCACHE_CONFIG_READ(read_uint(obj, "num_threads", s, c.num_threads));
    return Result<void>();
}

Result<void> load_section(const rapidjson::Document& doc, const char* name,
                          const std::function<Result<void>(const rapidjson::Value&)>& load) {
    if (!doc.HasMember(name)) return Result<void>();
    const auto& section = doc[name];
    if (!section.IsObject()) return type_error(name, "an object");
    return load(section);
}

} // namespace

Result<void> ConfigLoader::LoadString(const std::string& json, Config& config) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return Result<void>::error(
            std::string("Invalid config JSON at offset ") + std::to_string(doc.GetErrorOffset()) +
                ": " + rapidjson::GetParseError_En(doc.GetParseError()),
            Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<void>::error("Config root must be a JSON object", Error::Code::INVALID_ARGUMENT);
    }

    // Work on a copy so a failed load leaves the caller's config untouched
    Config loaded = config;
    OFFCACHE_CONFIG_READ(load_section(doc, "origin",
        [&](const rapidjson::Value& v) { return load_origin(v, loaded.origin); }));
    OFFCACHE_CONFIG_READ(load_section(doc, "cache",
        [&](const rapidjson::Value& v) { return load_cache(v, loaded.cache); }));
    OFFCACHE_CONFIG_READ(load_section(doc, "store",
        [&](const rapidjson::Value& v) { return load_store(v, loaded.store); }));
    OFFCACHE_CONFIG_READ(load_section(doc, "fetcher",
        [&](const rapidjson::Value& v) { return load_fetcher(v, loaded.fetcher); }));
    OFFCACHE_CONFIG_READ(load_section(doc, "server",
        [&](const rapidjson::Value& v) { return load_server(v, loaded.server); }));
    OFFCACHE_CONFIG_READ(load_section(doc, "background", [&](const rapidjson::Value& v) {
        OFFCACHE_CONFIG_READ(read_uint(v, "workers", "background", loaded.background_workers));
        OFFCACHE_CONFIG_READ(read_uint(v, "queue_size", "background", loaded.background_queue_size));
        OFFCACHE_CONFIG_READ(read_uint(v, "fetch_workers", "background", loaded.background_fetch_workers));
        return Result<void>();
    }));

    auto valid = loaded.Validate();
    if (!valid.ok()) {
        return valid;
    }
    config = std::move(loaded);
    return Result<void>();
}

Result<void> ConfigLoader::LoadFile(const std::string& path, Config& config) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Result<void>::error("Cannot open config file: " + path, Error::Code::NOT_FOUND);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return Result<void>::error("Failed to read config file: " + path, Error::Code::INTERNAL);
    }
    return LoadString(buffer.str(), config);
}

#undef OFFCACHE_CONFIG_READ

} // namespace core
} // namespace offcache
