#include <gtest/gtest.h>
#include "auth/TerminalAuthenticator.hpp"
#include "errors/Error.hpp"
#include "TestSupport.hpp"

#include <fstream>

using namespace lsm;
using namespace lsm::auth;

TEST(AsyncAuthenticatorTest, SuccessReturns) {
    test::ThreadedAuthenticator a({Outcome::Success, ""});
    EXPECT_NO_THROW(a.authenticate("prompt"));
}

TEST(AsyncAuthenticatorTest, CancelMapsToAuthCanceled) {
    test::ThreadedAuthenticator a({Outcome::Canceled, "User canceled"});
    try {
        a.authenticate("prompt");
        FAIL() << "expected AuthCanceledError";
    } catch (const AuthCanceledError& e) {
        EXPECT_STREQ(e.what(), "User canceled");
        EXPECT_EQ(e.code, ErrorCode::AuthCanceled);
    }
}

TEST(AsyncAuthenticatorTest, FailureMapsToAuthFailed) {
    test::ThreadedAuthenticator a({Outcome::Failed, "biometry locked out"});
    EXPECT_THROW(a.authenticate("prompt"), AuthFailedError);
}

TEST(AsyncAuthenticatorTest, SecondCompletionIgnored) {
    test::ThreadedAuthenticator a({Outcome::Success, ""}, 2);
    EXPECT_NO_THROW(a.authenticate("prompt"));
    EXPECT_NO_THROW(a.authenticate("prompt"));
}

TEST(AsyncAuthenticatorTest, AbandonedFlowFails) {
    test::AbandoningAuthenticator a;
    EXPECT_THROW(a.authenticate("prompt"), AuthFailedError);
}

class TerminalAuthenticatorTest : public ::testing::Test {
protected:
    void answer(const std::string& text) const {
        std::ofstream(tty) << text;
    }

    test::TempDir tmp;
    std::filesystem::path tty = tmp.path() / "tty";
};

TEST_F(TerminalAuthenticatorTest, YesConfirms) {
    answer("yes\n");
    TerminalAuthenticator a(tty);
    EXPECT_NO_THROW(a.authenticate("Authentication required to access 'svc'"));
}

TEST_F(TerminalAuthenticatorTest, AnythingElseCancels) {
    answer("no\n");
    TerminalAuthenticator a(tty);
    EXPECT_THROW(a.authenticate("prompt"), AuthCanceledError);
}

TEST_F(TerminalAuthenticatorTest, EndOfInputCancels) {
    answer("");
    TerminalAuthenticator a(tty);
    EXPECT_THROW(a.authenticate("prompt"), AuthCanceledError);
}

TEST_F(TerminalAuthenticatorTest, MissingTerminalFails) {
    TerminalAuthenticator a(tmp.path() / "missing" / "tty");
    EXPECT_THROW(a.authenticate("prompt"), AuthFailedError);
}
