#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <vector>

namespace lsm::log {

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    log_dir_ = logDir;
    main_log_path_ = log_dir_ / "locksmith.log";

    const auto& cnf = config::ConfigRegistry::get().logging;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks{console_sink_};

    // main file sink (rotating); a read-only home must not break the CLI
    try {
        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(log_dir_, ec);
        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    } catch (const spdlog::spdlog_ex& e) {
        console_sink_->log(spdlog::details::log_msg(
            "locksmith", spdlog::level::warn,
            fmt::format("[Registry] File logging disabled: {}", e.what())));
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("locksmith", sub_levels.locksmith);
    makeLogger("crypto",    sub_levels.crypto);
    makeLogger("cache",     sub_levels.cache);
    makeLogger("store",     sub_levels.store);
    makeLogger("auth",      sub_levels.auth);
    makeLogger("config",    sub_levels.config);
    makeLogger("notify",    sub_levels.notify);
    makeLogger("cli",       sub_levels.cli);

    initialized_ = true;
    locksmith()->debug("[Registry] Initialized, logging to {}", main_log_path_.string());
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    if (!initialized_) return;
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
    spdlog::drop_all();
    console_sink_.reset();
    main_file_sink_.reset();
    initialized_ = false;
}

}
