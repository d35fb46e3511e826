#pragma once

#include "auth/TerminalAuthenticator.hpp"
#include "cli/Commands.hpp"
#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "core/Locksmith.hpp"
#include "log/Registry.hpp"
#include "storage/SecretServiceStore.hpp"

namespace lsm::app {

// Loads configuration, brings up logging and wires the Secret Service
// backend behind a terminal presence check. Throws lsm::Error.
inline cli::Context bootstrap() {
    config::ConfigRegistry::init();
    log::Registry::init(paths::getLogDir());

    const auto& cfg = config::ConfigRegistry::get();

    cli::Context ctx{
        .openLocksmith = [cacheDir = cfg.cache.resolvedDir(), ttl = cfg.cache.ttl] {
            auto authenticator = std::make_shared<auth::TerminalAuthenticator>();
            auto store = std::make_shared<storage::SecretServiceStore>(std::move(authenticator));
            return core::Locksmith::open(std::move(store), cacheDir,
                                         {.service = core::kDefaultService, .cacheTTL = ttl, .keyLocks = nullptr});
        },
        .config = cfg,
    };
    return ctx;
}

}
