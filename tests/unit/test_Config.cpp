#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "errors/Error.hpp"
#include "TestSupport.hpp"

#include <cstdlib>
#include <fstream>

using namespace lsm;
using namespace lsm::config;
using namespace std::chrono;

TEST(ConfigTest, Defaults) {
    const Config cfg;
    EXPECT_EQ(cfg.notifications.expiring_threshold, "7d");
    EXPECT_EQ(cfg.notifications.expiringThreshold(), hours(24 * 7));
    EXPECT_EQ(cfg.notifications.method, NotificationMethod::Stderr);
    EXPECT_TRUE(cfg.notifications.show_on_get);
    EXPECT_TRUE(cfg.notifications.show_on_list);
    EXPECT_EQ(cfg.cache.ttl, hours(1));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cfg.logging.levels.file_log_level, spdlog::level::info);
}

TEST(ConfigTest, EmptyDocumentIsDefaults) {
    const auto cfg = loadConfigFromString("");
    EXPECT_EQ(cfg.notifications.method, NotificationMethod::Stderr);
}

TEST(ConfigTest, MissingFileIsDefaults) {
    const test::TempDir tmp;
    const auto cfg = loadConfig(tmp.path() / "nope.yml");
    EXPECT_EQ(cfg.notifications.expiring_threshold, "7d");
}

TEST(ConfigTest, LoadsNotificationsAndCache) {
    const auto cfg = loadConfigFromString(R"(
notifications:
  expiring_threshold: 2w
  method: silent
  show_on_get: false
  show_on_list: false
cache:
  dir: /tmp/locksmith-cache
  ttl: 30m
logging:
  console_log_level: error
  subsystem_levels:
    cache: debug
)");
    EXPECT_EQ(cfg.notifications.expiringThreshold(), hours(24 * 14));
    EXPECT_EQ(cfg.notifications.method, NotificationMethod::Silent);
    EXPECT_FALSE(cfg.notifications.show_on_get);
    EXPECT_FALSE(cfg.notifications.show_on_list);
    EXPECT_EQ(cfg.cache.dir, "/tmp/locksmith-cache");
    EXPECT_EQ(cfg.cache.resolvedDir(), "/tmp/locksmith-cache");
    EXPECT_EQ(cfg.cache.ttl, minutes(30));
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::err);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cache, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.locksmith, spdlog::level::info);
}

TEST(ConfigTest, LoadsFromFile) {
    const test::TempDir tmp;
    const auto path = tmp.path() / "config.yml";
    std::ofstream(path) << "notifications:\n  method: native-notification\n";
    EXPECT_EQ(loadConfig(path).notifications.method, NotificationMethod::NativeNotification);
}

TEST(ConfigTest, LegacyMethodAlias) {
    EXPECT_EQ(parseNotificationMethod("macos"), NotificationMethod::NativeNotification);
}

TEST(ConfigTest, RejectsUnknownMethod) {
    EXPECT_THROW(loadConfigFromString("notifications:\n  method: carrier-pigeon\n"), InvalidConfigError);
}

TEST(ConfigTest, RejectsBadThreshold) {
    EXPECT_THROW(loadConfigFromString("notifications:\n  expiring_threshold: soon\n"), InvalidConfigError);
}

TEST(ConfigTest, RejectsBadCacheTtl) {
    EXPECT_THROW(loadConfigFromString("cache:\n  ttl: forever\n"), InvalidConfigError);
}

TEST(ConfigTest, RejectsMalformedYaml) {
    EXPECT_THROW(loadConfigFromString("notifications: [unterminated\n"), InvalidConfigError);
    EXPECT_THROW(loadConfigFromString("- just\n- a list\n"), InvalidConfigError);
    EXPECT_THROW(loadConfigFromString("notifications: 5\n"), InvalidConfigError);
}

TEST(ConfigTest, SilentEnvironmentOverride) {
    Config cfg;
    ::setenv("LOCKSMITH_SILENT", "true", 1);
    applyEnvironmentOverrides(cfg);
    ::unsetenv("LOCKSMITH_SILENT");
    EXPECT_EQ(cfg.notifications.method, NotificationMethod::Silent);

    Config untouched;
    ::setenv("LOCKSMITH_SILENT", "1", 1);
    applyEnvironmentOverrides(untouched);
    ::unsetenv("LOCKSMITH_SILENT");
    EXPECT_EQ(untouched.notifications.method, NotificationMethod::Stderr);
}

TEST(ConfigTest, RegistryServesLoadedConfig) {
    EXPECT_NO_THROW((void)ConfigRegistry::get());
}
