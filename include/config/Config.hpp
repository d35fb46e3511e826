#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>

namespace lsm::config {

enum class NotificationMethod : uint8_t {
    Stderr,
    NativeNotification,
    Silent
};

NotificationMethod parseNotificationMethod(const std::string& s);
std::string to_string(NotificationMethod method);

struct NotificationsConfig {
    std::string expiring_threshold = "7d";
    NotificationMethod method = NotificationMethod::Stderr;
    bool show_on_get = true;
    bool show_on_list = true;

    [[nodiscard]] std::chrono::seconds expiringThreshold() const;
};

struct CacheConfig {
    std::filesystem::path dir;                      // empty: paths::getCacheDir()
    std::chrono::seconds ttl = std::chrono::hours(1);

    [[nodiscard]] std::filesystem::path resolvedDir() const;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum locksmith = spdlog::level::info;   // Orchestrator decisions, cache fallbacks
    spdlog::level::level_enum crypto    = spdlog::level::warn;   // Rare; surface failure to encrypt/decrypt
    spdlog::level::level_enum cache     = spdlog::level::warn;   // Tampered entries, I/O failures, traversal attempts
    spdlog::level::level_enum store     = spdlog::level::warn;   // Credential store backend errors
    spdlog::level::level_enum auth      = spdlog::level::warn;   // Canceled or failed presence checks
    spdlog::level::level_enum config    = spdlog::level::warn;
    spdlog::level::level_enum notify    = spdlog::level::warn;   // Notification delivery failures only
    spdlog::level::level_enum cli       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::warn;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;
};

struct Config {
    NotificationsConfig notifications;
    CacheConfig cache;
    LoggingConfig logging;
};

// Missing file yields defaults; malformed content throws InvalidConfigError.
Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

// LOCKSMITH_SILENT=true forces silent notifications
void applyEnvironmentOverrides(Config& cfg);

} // namespace lsm::config
