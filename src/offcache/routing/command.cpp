#include "offcache/routing/command.h"

#include <rapidjson/document.h>

namespace offcache {
namespace routing {

namespace {

std::optional<Command> from_identifier(const std::string& id) {
    if (id == "force-activate" || id == "skipWaiting") {
        return Command::FORCE_ACTIVATE;
    }
    if (id == "cleanup" || id == "cleanupCaches") {
        return Command::CLEANUP;
    }
    return std::nullopt;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

} // namespace

const char* to_string(Command command) {
    switch (command) {
        case Command::FORCE_ACTIVATE: return "force-activate";
        case Command::CLEANUP: return "cleanup";
    }
    return "unknown";
}

std::optional<Command> parse_command(const std::string& message) {
    std::string text = trim(message);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text[0] != '{') {
        return from_identifier(text);
    }

    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return std::nullopt;
    }
    auto it = doc.FindMember("action");
    if (it == doc.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return from_identifier(std::string(it->value.GetString(), it->value.GetStringLength()));
}

} // namespace routing
} // namespace offcache
