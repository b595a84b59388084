#include <gtest/gtest.h>

#include "offcache/core/config.h"

namespace offcache {
namespace core {
namespace {

TEST(ConfigTest, DefaultsAreValid) {
    Config config;
    auto result = config.Validate();
    EXPECT_TRUE(result.ok()) << result.error();

    EXPECT_EQ(config.cache.version, "v1");
    EXPECT_EQ(config.cache.api_timeout.count(), 5000);
    EXPECT_EQ(config.cache.navigation_timeout.count(), 3000);
    EXPECT_EQ(config.cache.image_max_entries, 50u);
    EXPECT_EQ(config.cache.precache_manifest.size(), 7u);
    EXPECT_EQ(config.cache.offline_page, "/offline.html");
    EXPECT_TRUE(config.cache.skip_waiting_on_install);
    EXPECT_EQ(config.origin.api_prefix, "/api/");
    EXPECT_EQ(config.origin.static_prefix, "/_next/static/");
}

TEST(ConfigTest, VersionGrammar) {
    EXPECT_TRUE(is_valid_version("v1"));
    EXPECT_TRUE(is_valid_version("v12"));
    EXPECT_TRUE(is_valid_version("v1.2.3"));
    EXPECT_FALSE(is_valid_version(""));
    EXPECT_FALSE(is_valid_version("v"));
    EXPECT_FALSE(is_valid_version("1"));
    EXPECT_FALSE(is_valid_version("v1."));
    EXPECT_FALSE(is_valid_version("v1..2"));
    EXPECT_FALSE(is_valid_version("v1-beta"));
    EXPECT_FALSE(is_valid_version("V1"));
}

TEST(ConfigTest, RejectsInvalidVersion) {
    Config config;
    config.cache.version = "latest";
    auto result = config.Validate();
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ConfigTest, RejectsRelativeManifestEntry) {
    Config config;
    config.cache.precache_manifest.push_back("dogs");
    EXPECT_FALSE(config.Validate().ok());
}

TEST(ConfigTest, RejectsZeroTimeoutsAndWorkers) {
    Config config;
    config.cache.api_timeout = std::chrono::milliseconds(0);
    EXPECT_FALSE(config.Validate().ok());

    config = Config();
    config.background_workers = 0;
    EXPECT_FALSE(config.Validate().ok());

    config = Config();
    config.cache.image_max_entries = 0;
    EXPECT_FALSE(config.Validate().ok());
}

TEST(ConfigTest, RejectsUnknownBackendAndOrigin) {
    Config config;
    config.store.backend = "redis";
    EXPECT_FALSE(config.Validate().ok());

    config = Config();
    config.origin.origin = "ftp://example.com";
    EXPECT_FALSE(config.Validate().ok());
}

} // namespace
} // namespace core
} // namespace offcache
