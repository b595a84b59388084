#include <gtest/gtest.h>

#include "offcache/routing/command.h"

using offcache::routing::Command;
using offcache::routing::parse_command;

TEST(CommandTest, BareIdentifiers) {
    EXPECT_EQ(parse_command("force-activate"), Command::FORCE_ACTIVATE);
    EXPECT_EQ(parse_command("cleanup"), Command::CLEANUP);
    EXPECT_EQ(parse_command("  cleanup\n"), Command::CLEANUP);
}

TEST(CommandTest, LegacyAliases) {
    EXPECT_EQ(parse_command("skipWaiting"), Command::FORCE_ACTIVATE);
    EXPECT_EQ(parse_command("cleanupCaches"), Command::CLEANUP);
}

TEST(CommandTest, JsonMessages) {
    EXPECT_EQ(parse_command(R"({"action":"force-activate"})"), Command::FORCE_ACTIVATE);
    EXPECT_EQ(parse_command(R"( { "action" : "cleanup", "source": "settings" } )"), Command::CLEANUP);
    EXPECT_EQ(parse_command(R"({"action":"skipWaiting"})"), Command::FORCE_ACTIVATE);
}

TEST(CommandTest, UnknownOrMalformedIgnored) {
    EXPECT_FALSE(parse_command("").has_value());
    EXPECT_FALSE(parse_command("   ").has_value());
    EXPECT_FALSE(parse_command("reload").has_value());
    EXPECT_FALSE(parse_command("CLEANUP").has_value());
    EXPECT_FALSE(parse_command("{").has_value());
    EXPECT_FALSE(parse_command(R"({"type":"cleanup"})").has_value());
    EXPECT_FALSE(parse_command(R"({"action":42})").has_value());
    EXPECT_FALSE(parse_command(R"({"action":"purge"})").has_value());
    EXPECT_FALSE(parse_command(R"(["cleanup"])").has_value());
}

TEST(CommandTest, Names) {
    EXPECT_STREQ(offcache::routing::to_string(Command::FORCE_ACTIVATE), "force-activate");
    EXPECT_STREQ(offcache::routing::to_string(Command::CLEANUP), "cleanup");
}
