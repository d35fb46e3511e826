#pragma once

#include "auth/Authenticator.hpp"
#include "errors/Error.hpp"

#include <atomic>
#include <filesystem>
#include <random>
#include <string>
#include <thread>

namespace lsm::test {

// Counts presence checks and answers with a fixed outcome.
class ScriptedAuthenticator : public auth::Authenticator {
public:
    enum class Mode { Allow, Cancel, Fail };

    explicit ScriptedAuthenticator(const Mode mode = Mode::Allow) : mode_(mode) {}

    void authenticate(const std::string& prompt) override {
        ++calls;
        lastPrompt = prompt;
        switch (mode_.load()) {
        case Mode::Allow: return;
        case Mode::Cancel: throw AuthCanceledError("Authentication canceled by user");
        case Mode::Fail: throw AuthFailedError("Authentication failed");
        }
    }

    void setMode(const Mode mode) { mode_ = mode; }

    std::atomic<int> calls{0};
    std::string lastPrompt;

private:
    std::atomic<Mode> mode_;
};

// Completes the callback flow from a detached worker thread, like a platform
// biometric dialog would.
class ThreadedAuthenticator : public auth::AsyncAuthenticator {
public:
    explicit ThreadedAuthenticator(auth::AuthResult result, const int completions = 1)
        : result_(std::move(result)), completions_(completions) {}

protected:
    void begin(const std::string&, Completion done) override {
        std::thread([result = result_, n = completions_, done = std::move(done)] {
            for (int i = 0; i < n; ++i) done(result);
        }).detach();
    }

private:
    auth::AuthResult result_;
    int completions_;
};

// Drops the completion without calling it.
class AbandoningAuthenticator : public auth::AsyncAuthenticator {
protected:
    void begin(const std::string&, Completion) override {}
};

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("locksmith-" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
