#pragma once

#include <functional>
#include <string>

namespace lsm::auth {

// Blocks the calling thread until the user proves presence. Returns on
// success, throws AuthCanceledError or AuthFailedError otherwise. There is
// no timeout: only the user ends the flow.
class Authenticator {
public:
    virtual ~Authenticator() = default;

    virtual void authenticate(const std::string& prompt) = 0;
};

enum class Outcome {
    Success,
    Canceled,
    Failed
};

struct AuthResult {
    Outcome outcome = Outcome::Failed;
    std::string detail;
};

// Adapts a callback-driven platform flow to the blocking contract. begin()
// starts the flow and must eventually invoke the completion exactly once,
// from any thread. Dropping every copy of the completion without invoking it
// counts as a failure.
class AsyncAuthenticator : public Authenticator {
public:
    using Completion = std::function<void(AuthResult)>;

    void authenticate(const std::string& prompt) final;

protected:
    virtual void begin(const std::string& prompt, Completion done) = 0;
};

}
