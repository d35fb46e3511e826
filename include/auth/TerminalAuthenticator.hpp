#pragma once

#include "auth/Authenticator.hpp"

#include <filesystem>

namespace lsm::auth {

// Presence confirmation on the controlling terminal, used where no platform
// biometric service is reachable. The user must answer "yes".
class TerminalAuthenticator : public Authenticator {
public:
    explicit TerminalAuthenticator(std::filesystem::path tty = "/dev/tty");

    void authenticate(const std::string& prompt) override;

private:
    std::filesystem::path tty_;
};

}
