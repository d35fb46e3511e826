#pragma once

#include <filesystem>

namespace lsm::paths {

// $HOME/.locksmith unless redirected for tests
std::filesystem::path getBaseDir();

std::filesystem::path getConfigPath();
std::filesystem::path getCacheDir();
std::filesystem::path getLogDir();

// Expands a leading "~/" against the user's home directory
std::filesystem::path expandHome(const std::string& path);

void setBaseDirForTesting(const std::filesystem::path& dir);

}
