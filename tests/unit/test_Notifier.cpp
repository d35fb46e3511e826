#include <gtest/gtest.h>
#include "notify/Notifier.hpp"

#include <sstream>

using namespace lsm;
using namespace lsm::notify;
using namespace lsm::types;
using namespace std::chrono;

class NotifierTest : public ::testing::Test {
protected:
    [[nodiscard]] Notifier make(const config::NotificationMethod method) {
        config::NotificationsConfig cfg;
        cfg.method = method;
        return Notifier(cfg, err);
    }

    [[nodiscard]] SecretMetadata expiringIn(const seconds d) const { return {now - hours(1), now + d}; }

    std::ostringstream err;
    const TimePoint now = Clock::now();
};

TEST_F(NotifierTest, ExpiringMessage) {
    const auto meta = expiringIn(hours(24 * 3) + minutes(5));
    EXPECT_EQ(Notifier::formatMessage("svc", meta, ExpirationStatus::Expiring, now),
              "Warning: Secret 'svc' expires in 3 days");
}

TEST_F(NotifierTest, ExpiredMessage) {
    const auto meta = expiringIn(-hours(5));
    EXPECT_EQ(Notifier::formatMessage("svc", meta, ExpirationStatus::Expired, now),
              "Warning: Secret 'svc' expired 5 hours ago");
}

TEST_F(NotifierTest, StderrWritesOneLine) {
    EXPECT_TRUE(make(config::NotificationMethod::Stderr).notifyExpiration("svc", expiringIn(minutes(30)), now));
    EXPECT_EQ(err.str(), "Warning: Secret 'svc' expires in 30 minutes\n");
}

TEST_F(NotifierTest, ValidSecretIsQuiet) {
    EXPECT_FALSE(make(config::NotificationMethod::Stderr).notifyExpiration("svc", expiringIn(hours(24 * 30)), now));
    EXPECT_TRUE(err.str().empty());
}

TEST_F(NotifierTest, SilentIsQuiet) {
    EXPECT_FALSE(make(config::NotificationMethod::Silent).notifyExpiration("svc", expiringIn(-hours(1)), now));
    EXPECT_TRUE(err.str().empty());
}

TEST_F(NotifierTest, UnknownMetadataIsQuiet) {
    EXPECT_FALSE(make(config::NotificationMethod::Stderr).notifyExpiration("svc", SecretMetadata{}, now));
    EXPECT_TRUE(err.str().empty());
}

TEST_F(NotifierTest, InvalidThresholdIsLoggedNotThrown) {
    config::NotificationsConfig cfg;
    cfg.expiring_threshold = "soon";
    const Notifier n(cfg, err);
    EXPECT_FALSE(n.notifyExpiration("svc", expiringIn(minutes(1)), now));
}
