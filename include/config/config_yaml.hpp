#pragma once

#include "config/Config.hpp"
#include "config/paths.hpp"
#include "util/duration.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace lsm::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<NotificationsConfig> {
    static Node encode(const NotificationsConfig& rhs) {
        Node node;
        node["expiring_threshold"] = rhs.expiring_threshold;
        node["method"] = to_string(rhs.method);
        node["show_on_get"] = rhs.show_on_get;
        node["show_on_list"] = rhs.show_on_list;
        return node;
    }

    static bool decode(const Node& node, NotificationsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.expiring_threshold = node["expiring_threshold"].as<std::string>("7d");
        rhs.method = parseNotificationMethod(node["method"].as<std::string>("stderr"));
        rhs.show_on_get = node["show_on_get"].as<bool>(true);
        rhs.show_on_list = node["show_on_list"].as<bool>(true);
        (void)rhs.expiringThreshold(); // reject bad thresholds at load time
        return true;
    }
};

template<>
struct convert<CacheConfig> {
    static Node encode(const CacheConfig& rhs) {
        Node node;
        if (!rhs.dir.empty()) node["dir"] = rhs.dir.string();
        node["ttl"] = lsm::util::formatClock(rhs.ttl);
        return node;
    }

    static bool decode(const Node& node, CacheConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["dir"]) rhs.dir = lsm::paths::expandHome(node["dir"].as<std::string>());
        rhs.ttl = lsm::util::parseDuration(node["ttl"].as<std::string>("1h"));
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["locksmith"] = to_std_string(spdlog::level::to_string_view(rhs.locksmith));
        node["crypto"]    = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["cache"]     = to_std_string(spdlog::level::to_string_view(rhs.cache));
        node["store"]     = to_std_string(spdlog::level::to_string_view(rhs.store));
        node["auth"]      = to_std_string(spdlog::level::to_string_view(rhs.auth));
        node["config"]    = to_std_string(spdlog::level::to_string_view(rhs.config));
        node["notify"]    = to_std_string(spdlog::level::to_string_view(rhs.notify));
        node["cli"]       = to_std_string(spdlog::level::to_string_view(rhs.cli));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.locksmith = spdlog::level::from_str(node["locksmith"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.cache = spdlog::level::from_str(node["cache"].as<std::string>("warn"));
        rhs.store = spdlog::level::from_str(node["store"].as<std::string>("warn"));
        rhs.auth = spdlog::level::from_str(node["auth"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        rhs.notify = spdlog::level::from_str(node["notify"].as<std::string>("warn"));
        rhs.cli = spdlog::level::from_str(node["cli"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("warn"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node = convert<LogLevelsConfig>::encode(rhs.levels);
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
