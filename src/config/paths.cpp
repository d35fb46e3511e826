#include "config/paths.hpp"
#include "errors/Error.hpp"

#include <cstdlib>
#include <mutex>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace lsm::paths {

namespace {
std::mutex mutex;
fs::path baseOverride;
}

static fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) return home;
    if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) return pw->pw_dir;
    throw IOFailureError("Unable to resolve the user's home directory");
}

fs::path getBaseDir() {
    {
        std::scoped_lock lock(mutex);
        if (!baseOverride.empty()) return baseOverride;
    }
    return homeDir() / ".locksmith";
}

fs::path getConfigPath() { return getBaseDir() / "config.yml"; }

fs::path getCacheDir() { return getBaseDir() / "cache"; }

fs::path getLogDir() { return getBaseDir() / "logs"; }

fs::path expandHome(const std::string& path) {
    if (path == "~") return homeDir();
    if (path.starts_with("~/")) return homeDir() / path.substr(2);
    return path;
}

void setBaseDirForTesting(const fs::path& dir) {
    std::scoped_lock lock(mutex);
    baseOverride = dir;
}

}
