#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <filesystem>

namespace lsm::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels from ConfigRegistry.
    static void init(const std::filesystem::path& logDir);

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> locksmith() { return get("locksmith"); }
    static std::shared_ptr<spdlog::logger> crypto()    { return get("crypto"); }
    static std::shared_ptr<spdlog::logger> cache()     { return get("cache"); }
    static std::shared_ptr<spdlog::logger> store()     { return get("store"); }
    static std::shared_ptr<spdlog::logger> auth()      { return get("auth"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }
    static std::shared_ptr<spdlog::logger> notify()    { return get("notify"); }
    static std::shared_ptr<spdlog::logger> cli()       { return get("cli"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    // stdout carries command output only, so the console sink is stderr
    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 3;
};

}
