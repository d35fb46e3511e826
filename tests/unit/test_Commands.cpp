#include <gtest/gtest.h>
#include "cli/Commands.hpp"
#include "core/Locksmith.hpp"
#include "storage/MemoryCredentialStore.hpp"
#include "TestSupport.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace lsm;
using json = nlohmann::json;
using Mode = lsm::test::ScriptedAuthenticator::Mode;

class CommandsTest : public ::testing::Test {
protected:
    int run(const std::vector<std::string>& args) {
        out.str("");
        err.str("");
        return cli::run(args, ctx);
    }

    test::TempDir tmp;
    std::shared_ptr<test::ScriptedAuthenticator> auth = std::make_shared<test::ScriptedAuthenticator>();
    std::shared_ptr<storage::MemoryCredentialStore> store = std::make_shared<storage::MemoryCredentialStore>(auth);
    std::ostringstream out, err;
    int opened = 0;

    cli::Context ctx{
        .openLocksmith = [this] {
            ++opened;
            return core::Locksmith::open(store, tmp.path() / "cache");
        },
        .config = {},
        .out = out,
        .err = err,
    };
};

TEST_F(CommandsTest, NoArgumentsPrintsUsageAndFails) {
    EXPECT_EQ(run({}), 1);
    EXPECT_NE(out.str().find("Usage: locksmith"), std::string::npos);
}

TEST_F(CommandsTest, HelpAndVersionDoNotOpenTheStore) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_NE(out.str().find("add <key> <secret>"), std::string::npos);
    EXPECT_EQ(run({"-v"}), 0);
    EXPECT_EQ(out.str(), std::string("locksmith v") + LOCKSMITH_VERSION + "\n");
    EXPECT_EQ(opened, 0);
}

TEST_F(CommandsTest, UnknownCommandFails) {
    EXPECT_EQ(run({"frobnicate"}), 1);
    EXPECT_EQ(err.str(), "Unknown command: frobnicate\n");
    EXPECT_EQ(opened, 0);
}

TEST_F(CommandsTest, AddThenGet) {
    EXPECT_EQ(run({"add", "svc", "tok123"}), 0);
    EXPECT_NE(out.str().find("Successfully saved secret 'svc'"), std::string::npos);

    EXPECT_EQ(run({"get", "svc"}), 0);
    EXPECT_EQ(out.str(), "tok123\n");
    EXPECT_TRUE(err.str().empty());
    EXPECT_EQ(auth->calls.load(), 1);
}

TEST_F(CommandsTest, GetWarnsWhenExpiring) {
    ASSERT_EQ(run({"add", "svc", "tok123", "--expires", "2d"}), 0);
    EXPECT_EQ(run({"get", "svc"}), 0);
    EXPECT_EQ(out.str(), "tok123\n");
    EXPECT_NE(err.str().find("Warning: Secret 'svc' expires in 1 days"), std::string::npos);

    ctx.config.notifications.show_on_get = false;
    EXPECT_EQ(run({"get", "svc"}), 0);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CommandsTest, GetJson) {
    ASSERT_EQ(run({"add", "--expires=1h", "svc", "tok123"}), 0);
    ASSERT_EQ(run({"get", "svc", "--json"}), 0);

    const auto j = json::parse(out.str());
    EXPECT_EQ(j["key"], "svc");
    EXPECT_EQ(j["value"], "tok123");
    EXPECT_FALSE(j["is_expired"].get<bool>());
    EXPECT_TRUE(j["is_expiring"].get<bool>());
    EXPECT_TRUE(j["expires_at"].is_string());
    EXPECT_TRUE(j["expires_in"].get<std::string>().ends_with("s"));
}

TEST_F(CommandsTest, InvalidDurationFails) {
    EXPECT_EQ(run({"add", "svc", "tok123", "--expires", "soon"}), 1);
    EXPECT_EQ(err.str().rfind("Error: invalid expiration duration", 0), 0u);
    EXPECT_EQ(store->size(), 1u);
}

TEST_F(CommandsTest, MissingArgumentsFail) {
    EXPECT_EQ(run({"add", "svc"}), 1);
    EXPECT_EQ(err.str(), "Error: usage: locksmith add <key> <secret> [--expires <duration>]\n");
    EXPECT_EQ(run({"get"}), 1);
    EXPECT_EQ(run({"delete"}), 1);
    EXPECT_EQ(run({"get", "svc", "--bogus"}), 1);
}

TEST_F(CommandsTest, ErrorsBecomeOneLineOnStderr) {
    EXPECT_EQ(run({"get", "missing"}), 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err.str().rfind("Error: ", 0), 0u);
    const auto message = err.str();
    EXPECT_EQ(std::ranges::count(message, '\n'), 1);

    auth->setMode(Mode::Cancel);
    EXPECT_EQ(run({"add", "svc", "tok123"}), 1);
    EXPECT_EQ(err.str(), "Error: Authentication canceled by user\n");
}

TEST_F(CommandsTest, ListTable) {
    EXPECT_EQ(run({"list"}), 0);
    EXPECT_EQ(out.str(), "No secrets stored.\n");

    ASSERT_EQ(run({"add", "fresh", "1", "--expires", "30d"}), 0);
    ASSERT_EQ(run({"add", "soon", "2", "--expires", "1d"}), 0);
    ASSERT_EQ(run({"add", "evicted", "3"}), 0);
    std::filesystem::remove(tmp.path() / "cache" / "evicted");

    ASSERT_EQ(run({"list"}), 0);
    const auto text = out.str();
    EXPECT_EQ(text.rfind("KEY", 0), 0u);
    EXPECT_NE(text.find(std::string(84, '-')), std::string::npos);
    EXPECT_NE(text.find("✓  Valid"), std::string::npos);
    EXPECT_NE(text.find("⚠️  Expiring"), std::string::npos);
    EXPECT_NE(text.find("N/A"), std::string::npos);
    EXPECT_NE(text.find("Unknown"), std::string::npos);

    ctx.config.notifications.show_on_list = false;
    ASSERT_EQ(run({"list"}), 0);
    EXPECT_EQ(out.str().find("Valid"), std::string::npos);
}

TEST_F(CommandsTest, LongKeysAreTruncated) {
    const std::string key(40, 'k');
    ASSERT_EQ(run({"add", key, "v"}), 0);
    ASSERT_EQ(run({"list"}), 0);
    EXPECT_NE(out.str().find(std::string(27, 'k') + "..."), std::string::npos);
    EXPECT_EQ(out.str().find(key), std::string::npos);
}

TEST_F(CommandsTest, Delete) {
    ASSERT_EQ(run({"add", "svc", "tok123"}), 0);
    EXPECT_EQ(run({"delete", "svc"}), 0);
    EXPECT_EQ(out.str(), "Successfully deleted secret 'svc'\n");
    EXPECT_EQ(run({"get", "svc"}), 1);
}

TEST_F(CommandsTest, SummonPrintsRawValue) {
    ASSERT_EQ(run({"add", "svc", "tok123"}), 0);
    out.str("");
    EXPECT_EQ(cli::runSummon({"svc"}, ctx), 0);
    EXPECT_EQ(out.str(), "tok123");
}

TEST_F(CommandsTest, SummonFailures) {
    EXPECT_EQ(cli::runSummon({}, ctx), 1);
    EXPECT_EQ(err.str(), "Error: No secret identifier provided\n");

    err.str("");
    EXPECT_EQ(cli::runSummon({"missing"}, ctx), 1);
    EXPECT_EQ(err.str().rfind("Error retrieving secret 'missing': ", 0), 0u);
}
