#ifndef OFFCACHE_ROUTING_COMMAND_H_
#define OFFCACHE_ROUTING_COMMAND_H_

#include <optional>
#include <string>

namespace offcache {
namespace routing {

/**
 * @brief Control channel commands
 */
enum class Command {
    FORCE_ACTIVATE,   // "force-activate", also "skipWaiting"
    CLEANUP           // "cleanup", also "cleanupCaches"
};

const char* to_string(Command command);

/**
 * @brief Decode a control message
 *
 * Accepts the bare identifier or a JSON object {"action": "<identifier>"}.
 * Surrounding whitespace is ignored.
 *
 * @return The command, or std::nullopt for unknown or malformed messages
 */
std::optional<Command> parse_command(const std::string& message);

} // namespace routing
} // namespace offcache

#endif // OFFCACHE_ROUTING_COMMAND_H_
