#include "offcache/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <utility>

namespace offcache {
namespace common {

namespace {
const char* kLoggerName = "offcache";
}

void Logger::Init() {
    if (spdlog::get(kLoggerName)) {
        return;
    }
    try {
        auto sink = spdlog::stderr_color_mt(kLoggerName);
        spdlog::set_default_logger(sink);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> Logger::ParseLevel(const std::string& name) {
    static const std::pair<const char*, spdlog::level::level_enum> kLevels[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& entry : kLevels) {
        if (name == entry.first) {
            return entry.second;
        }
    }
    return std::nullopt;
}

} // namespace common
} // namespace offcache
