#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/paths.hpp"
#include "errors/Error.hpp"
#include "util/duration.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace lsm::config {

NotificationMethod parseNotificationMethod(const std::string& s) {
    if (s == "stderr") return NotificationMethod::Stderr;
    if (s == "native-notification" || s == "macos") return NotificationMethod::NativeNotification;
    if (s == "silent") return NotificationMethod::Silent;
    throw InvalidConfigError("Unknown notification method: " + s);
}

std::string to_string(const NotificationMethod method) {
    switch (method) {
    case NotificationMethod::Stderr: return "stderr";
    case NotificationMethod::NativeNotification: return "native-notification";
    case NotificationMethod::Silent: return "silent";
    }
    return "stderr";
}

std::chrono::seconds NotificationsConfig::expiringThreshold() const {
    try {
        return util::parseDuration(expiring_threshold);
    } catch (const InvalidArgumentError& e) {
        throw InvalidConfigError(std::string("notifications.expiring_threshold: ") + e.what());
    }
}

fs::path CacheConfig::resolvedDir() const {
    return dir.empty() ? paths::getCacheDir() : dir;
}

static Config decodeRoot(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw InvalidConfigError("Configuration root must be a mapping");

    try {
        if (auto node = root["notifications"]; node && !YAML::convert<NotificationsConfig>::decode(node, cfg.notifications))
            throw InvalidConfigError("'notifications' must be a mapping");
        if (auto node = root["cache"]; node && !YAML::convert<CacheConfig>::decode(node, cfg.cache))
            throw InvalidConfigError("'cache' must be a mapping");
        if (auto node = root["logging"]; node && !YAML::convert<LoggingConfig>::decode(node, cfg.logging))
            throw InvalidConfigError("'logging' must be a mapping");
    } catch (const YAML::Exception& e) {
        throw InvalidConfigError(std::string("Invalid configuration value: ") + e.what());
    } catch (const InvalidArgumentError& e) {
        throw InvalidConfigError(std::string("Invalid configuration value: ") + e.what());
    }

    return cfg;
}

Config loadConfigFromString(const std::string& yaml) {
    try {
        return decodeRoot(YAML::Load(yaml));
    } catch (const YAML::ParserException& e) {
        throw InvalidConfigError(std::string("Malformed configuration: ") + e.what());
    }
}

Config loadConfig(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return {};

    try {
        return decodeRoot(YAML::LoadFile(path.string()));
    } catch (const YAML::BadFile& e) {
        throw InvalidConfigError("Unable to read configuration file " + path.string() + ": " + e.what());
    } catch (const YAML::ParserException& e) {
        throw InvalidConfigError("Malformed configuration file " + path.string() + ": " + e.what());
    }
}

void applyEnvironmentOverrides(Config& cfg) {
    if (const char* silent = std::getenv("LOCKSMITH_SILENT"); silent && std::string(silent) == "true")
        cfg.notifications.method = NotificationMethod::Silent;
}

} // namespace lsm::config
