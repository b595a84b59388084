#ifndef OFFCACHE_COMMON_LOGGER_H_
#define OFFCACHE_COMMON_LOGGER_H_

#include <optional>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace offcache {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Map a --log-level name (trace, debug, info, warn, error, critical, off)
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);
};

} // namespace common
} // namespace offcache

// Macros for convenient logging
#define OFFCACHE_TRACE(...) spdlog::trace(__VA_ARGS__)
#define OFFCACHE_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define OFFCACHE_INFO(...)  spdlog::info(__VA_ARGS__)
#define OFFCACHE_WARN(...)  spdlog::warn(__VA_ARGS__)
#define OFFCACHE_ERROR(...) spdlog::error(__VA_ARGS__)
#define OFFCACHE_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // OFFCACHE_COMMON_LOGGER_H_
