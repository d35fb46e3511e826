#include "auth/TerminalAuthenticator.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <fmt/core.h>

namespace lsm::auth {

TerminalAuthenticator::TerminalAuthenticator(std::filesystem::path tty) : tty_(std::move(tty)) {}

static std::string trim(std::string s) {
    const auto notSpace = [](const unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::ranges::find_if(s, notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

void TerminalAuthenticator::authenticate(const std::string& prompt) {
    using File = std::unique_ptr<FILE, decltype(&std::fclose)>;
    const File in(std::fopen(tty_.c_str(), "r"), &std::fclose);
    const File out(std::fopen(tty_.c_str(), "a"), &std::fclose);
    if (!in || !out) {
        log::Registry::auth()->warn("[TerminalAuthenticator] Cannot open {}: {}", tty_.string(), std::strerror(errno));
        throw AuthFailedError("No terminal available to confirm presence");
    }

    fmt::print(out.get(), "{}\nType 'yes' to continue: ", prompt);
    std::fflush(out.get());

    char buf[64] = {};
    if (!std::fgets(buf, sizeof(buf), in.get())) {
        fmt::print(out.get(), "\n");
        throw AuthCanceledError("Authentication canceled by user");
    }

    auto answer = trim(buf);
    std::ranges::transform(answer, answer.begin(), [](const unsigned char c) { return std::tolower(c); });
    if (answer != "yes") {
        log::Registry::auth()->info("[TerminalAuthenticator] Presence confirmation declined");
        throw AuthCanceledError("Authentication canceled by user");
    }
}

}
