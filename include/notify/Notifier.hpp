#pragma once

#include "config/Config.hpp"
#include "types/Secret.hpp"

#include <iostream>
#include <string>

namespace lsm::notify {

// Warns about Expiring and Expired secrets through the configured channel.
// Delivery problems are logged and never reach the caller.
class Notifier {
public:
    explicit Notifier(config::NotificationsConfig config, std::ostream& err = std::cerr);

    // Returns true when a warning was emitted
    bool notifyExpiration(const std::string& key, const types::SecretMetadata& meta,
                          types::TimePoint now = types::Clock::now()) const;

    [[nodiscard]] static std::string formatMessage(const std::string& key, const types::SecretMetadata& meta,
                                                   types::ExpirationStatus status,
                                                   types::TimePoint now = types::Clock::now());

private:
    config::NotificationsConfig config_;
    std::ostream& err_;

    static void sendNative(const std::string& message);
};

}
