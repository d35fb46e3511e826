#pragma once

#include "config/Config.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace lsm::core {
class Locksmith;
}

namespace lsm::cli {

struct Context {
    // Invoked only for commands that touch secrets, so help and version
    // never reach the credential store.
    std::function<std::unique_ptr<core::Locksmith>()> openLocksmith;
    config::Config config;
    std::ostream& out = std::cout;
    std::ostream& err = std::cerr;
};

// argv without the program name. Returns the process exit code.
int run(const std::vector<std::string>& args, Context& ctx);

// summon provider contract: first argument is the secret id, the value is
// written raw without a trailing newline.
int runSummon(const std::vector<std::string>& args, Context& ctx);

void printUsage(std::ostream& os);

}
