#include "auth/Authenticator.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <atomic>
#include <future>
#include <memory>

namespace lsm::auth {

namespace {

struct PendingAuth {
    std::promise<AuthResult> promise;
    std::atomic<bool> fired{false};

    void complete(AuthResult result) {
        if (fired.exchange(true)) return;
        promise.set_value(std::move(result));
    }

    ~PendingAuth() {
        if (!fired.exchange(true))
            promise.set_value({Outcome::Failed, "authentication flow ended without a result"});
    }
};

}

void AsyncAuthenticator::authenticate(const std::string& prompt) {
    auto pending = std::make_shared<PendingAuth>();
    auto future = pending->promise.get_future();

    begin(prompt, [pending](AuthResult result) { pending->complete(std::move(result)); });
    pending.reset();

    const auto result = future.get();
    switch (result.outcome) {
    case Outcome::Success:
        return;
    case Outcome::Canceled:
        log::Registry::auth()->info("[AsyncAuthenticator] Authentication canceled by user");
        throw AuthCanceledError(result.detail.empty() ? "Authentication canceled by user" : result.detail);
    case Outcome::Failed:
        log::Registry::auth()->warn("[AsyncAuthenticator] Authentication failed: {}", result.detail);
        throw AuthFailedError(result.detail.empty() ? "Authentication failed" : result.detail);
    }
}

}
