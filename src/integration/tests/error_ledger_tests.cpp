#include <umbra/integration/error_ledger.hpp>
#include <scene/tests/mock_providers.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <stdexcept>

using namespace umbra;
using namespace umbra::integration;
using namespace umbra::test_support;
using namespace testing;

class ErrorLedgerTest : public ::testing::Test {
protected:
    ErrorLedger make_ledger() {
        return ErrorLedger(notifications, recovery, &sink);
    }

    ErrorContext with_fallback(std::string tier, std::string data, bool applied = true) {
        ErrorContext context;
        context.observer_id = "guard";
        context.target_id = "rogue";
        context.fallback = FallbackReport{applied, std::move(tier), std::move(data)};
        return context;
    }

    core::NotificationConfig notifications;
    core::RecoveryConfig recovery;
    NiceMock<MockNotificationSink> sink;
};

TEST_F(ErrorLedgerTest, SeverityFromMessage) {
    auto ledger = make_ledger();

    EXPECT_EQ(ledger.handle_system_error(SystemTag::Visibility, "wall index unavailable").severity, Severity::High);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Cover, "Token NOT FOUND").severity, Severity::High);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Cover, "cover detection failed").severity, Severity::Medium);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Visibility, "bad Calculation").severity, Severity::Medium);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Overrides, "something odd").severity, Severity::Low);
}

TEST_F(ErrorLedgerTest, StrategyFollowsSystem) {
    auto ledger = make_ledger();

    EXPECT_EQ(ledger.handle_system_error(SystemTag::Visibility, "x").strategy, FallbackStrategy::BasicCalculation);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Cover, "x").strategy, FallbackStrategy::ManualOverride);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::PositionTracker, "x").strategy,
              FallbackStrategy::GracefulDegradation);
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Overrides, "x").strategy, FallbackStrategy::SkipFeature);
}

TEST_F(ErrorLedgerTest, ErrorsMarkTheSystemDegraded) {
    auto ledger = make_ledger();
    EXPECT_TRUE(ledger.is_available(SystemTag::Cover));

    auto result = ledger.handle_system_error(SystemTag::Cover, "cover detection failed",
                                             with_fallback("wall-collision-fallback", "standard"));

    EXPECT_FALSE(ledger.is_available(SystemTag::Cover));
    EXPECT_TRUE(ledger.status(SystemTag::Cover).fallback_active);
    EXPECT_EQ(ledger.status(SystemTag::Cover).last_error, "cover detection failed");
    EXPECT_EQ(ledger.status(SystemTag::Cover).error_count, 1u);
    EXPECT_TRUE(ledger.is_available(SystemTag::Visibility));

    EXPECT_TRUE(result.fallback_applied);
    EXPECT_EQ(result.fallback_data, "standard");
    EXPECT_THAT(result.error_id, StartsWith("cover-"));
}

TEST_F(ErrorLedgerTest, FallbackNotificationNamesTheTier) {
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(scene::NotificationLevel::Info,
                             "cover system temporarily unavailable. Using fallback: wall-collision-fallback"));
    auto result = ledger.handle_system_error(SystemTag::Cover, "cover detection failed",
                                             with_fallback("wall-collision-fallback", "standard"));
    EXPECT_TRUE(result.notified);
}

TEST_F(ErrorLedgerTest, FailedFallbackNotifiesAnError) {
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(scene::NotificationLevel::Error,
                             "visibility system failed and fallback unsuccessful. "
                             "Some features may not work correctly."));
    ledger.handle_system_error(SystemTag::Visibility, "visibility calculation failed",
                               with_fallback("default-fallback", "observed", false));
}

TEST_F(ErrorLedgerTest, LowSeverityIsNotNotified) {
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(_, _)).Times(0);
    auto result = ledger.handle_system_error(SystemTag::Overrides, "minor glitch");
    EXPECT_FALSE(result.notified);
    EXPECT_EQ(ledger.get_error_history().size(), 1u);
}

TEST_F(ErrorLedgerTest, NotificationsAreCappedPerSession) {
    notifications.max_notifications_per_session = 2;
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(_, _)).Times(2);
    for (int i = 0; i < 5; ++i) {
        ledger.handle_system_error(SystemTag::Visibility, "visibility calculation failed",
                                   with_fallback("lighting-only-fallback", "concealed"));
    }

    EXPECT_EQ(ledger.notifications_sent(), 2u);
    // Every error is still recorded
    EXPECT_EQ(ledger.get_error_history().size(), 5u);
}

TEST_F(ErrorLedgerTest, ResetSessionRestoresNotifications) {
    notifications.max_notifications_per_session = 1;
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(_, _)).Times(2);
    ledger.handle_system_error(SystemTag::Cover, "cover detection failed", with_fallback("t", "none"));
    ledger.handle_system_error(SystemTag::Cover, "cover detection failed", with_fallback("t", "none"));
    ledger.reset_session();
    ledger.handle_system_error(SystemTag::Cover, "cover detection failed", with_fallback("t", "none"));
}

TEST_F(ErrorLedgerTest, FallbackNotificationsCanBeTurnedOff) {
    notifications.show_fallback = false;
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(_, _)).Times(0);
    ledger.handle_system_error(SystemTag::Cover, "cover detection failed", with_fallback("t", "none"));
}

TEST_F(ErrorLedgerTest, HistoryIsBoundedAndMostRecentFirst) {
    recovery.history_capacity = 3;
    auto ledger = make_ledger();

    for (int i = 0; i < 5; ++i) {
        ledger.handle_system_error(i % 2 == 0 ? SystemTag::Visibility : SystemTag::Cover,
                                   "error " + std::to_string(i));
    }

    auto history = ledger.get_error_history();
    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(history[0].message, "error 4");
    EXPECT_EQ(history[2].message, "error 2");
    EXPECT_GT(history[0].sequence, history[1].sequence);

    auto cover_only = ledger.get_error_history(SystemTag::Cover);
    ASSERT_EQ(cover_only.size(), 1u);
    EXPECT_EQ(cover_only[0].message, "error 3");
}

TEST_F(ErrorLedgerTest, RecoveryWithoutProbeFails) {
    auto ledger = make_ledger();
    ledger.handle_system_error(SystemTag::Cover, "cover detection failed");

    EXPECT_FALSE(ledger.attempt_system_recovery(SystemTag::Cover));
    EXPECT_FALSE(ledger.is_available(SystemTag::Cover));
}

TEST_F(ErrorLedgerTest, SuccessfulRecoveryRestoresAndNotifies) {
    auto ledger = make_ledger();
    ledger.register_probe(SystemTag::Cover, [] { return true; });
    ledger.handle_system_error(SystemTag::Cover, "detection failed");

    EXPECT_CALL(sink, notify(scene::NotificationLevel::Info, "cover system recovered"));
    EXPECT_TRUE(ledger.attempt_system_recovery(SystemTag::Cover));

    EXPECT_TRUE(ledger.is_available(SystemTag::Cover));
    EXPECT_FALSE(ledger.status(SystemTag::Cover).fallback_active);
    EXPECT_EQ(ledger.status(SystemTag::Cover).recovery_attempts, 0u);
    EXPECT_EQ(ledger.recovery_notifications_sent(), 1u);
}

TEST_F(ErrorLedgerTest, HealthySystemRecoversSilently) {
    auto ledger = make_ledger();
    ledger.register_probe(SystemTag::Visibility, [] { return true; });

    EXPECT_CALL(sink, notify(_, _)).Times(0);
    EXPECT_TRUE(ledger.attempt_system_recovery(SystemTag::Visibility));
}

TEST_F(ErrorLedgerTest, RecoveryAttemptsAreCapped) {
    auto ledger = make_ledger();
    int probes = 0;
    ledger.register_probe(SystemTag::Visibility, [&] {
        ++probes;
        return false;
    });
    ledger.handle_system_error(SystemTag::Visibility, "lighting unavailable");

    for (int i = 0; i < 5; ++i) {
        EXPECT_FALSE(ledger.attempt_system_recovery(SystemTag::Visibility));
    }
    EXPECT_EQ(probes, 3);
    EXPECT_EQ(ledger.status(SystemTag::Visibility).recovery_attempts, 3u);

    // Once recovery is exhausted, further errors are critical
    EXPECT_EQ(ledger.handle_system_error(SystemTag::Visibility, "minor").severity, Severity::Critical);

    ledger.reset_session();
    EXPECT_FALSE(ledger.attempt_system_recovery(SystemTag::Visibility));
    EXPECT_EQ(probes, 4);
}

TEST_F(ErrorLedgerTest, ThrowingProbeCountsAsFailure) {
    auto ledger = make_ledger();
    ledger.register_probe(SystemTag::Cover, []() -> bool { throw std::runtime_error("probe exploded"); });
    ledger.handle_system_error(SystemTag::Cover, "detection failed");

    EXPECT_FALSE(ledger.attempt_system_recovery(SystemTag::Cover));
    EXPECT_FALSE(ledger.is_available(SystemTag::Cover));
}

TEST_F(ErrorLedgerTest, RecoveryNotificationsAreCapped) {
    notifications.max_recovery_notifications = 1;
    auto ledger = make_ledger();
    ledger.register_probe(SystemTag::Cover, [] { return true; });

    EXPECT_CALL(sink, notify(scene::NotificationLevel::Info, "cover system recovered")).Times(1);
    for (int i = 0; i < 3; ++i) {
        ledger.handle_system_error(SystemTag::Cover, "minor");
        EXPECT_TRUE(ledger.attempt_system_recovery(SystemTag::Cover));
    }
}

TEST_F(ErrorLedgerTest, EscalationIgnoresTheSessionCap) {
    notifications.max_notifications_per_session = 0;
    auto ledger = make_ledger();

    EXPECT_CALL(sink, notify(scene::NotificationLevel::Error, "overrides system disabled: disk full"));
    ledger.escalate(SystemTag::Overrides, "disk full");

    EXPECT_FALSE(ledger.is_available(SystemTag::Overrides));
    auto history = ledger.get_error_history(SystemTag::Overrides);
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].severity, Severity::Critical);
}

TEST_F(ErrorLedgerTest, ThrowingSinkDoesNotPropagate) {
    auto ledger = make_ledger();
    ON_CALL(sink, notify(_, _)).WillByDefault(Throw(std::runtime_error("ui gone")));

    EXPECT_NO_THROW(ledger.handle_system_error(SystemTag::Cover, "detection failed",
                                               with_fallback("wall-collision-fallback", "standard")));
}

TEST_F(ErrorLedgerTest, StatusCoversEverySystem) {
    auto ledger = make_ledger();
    auto status = ledger.get_system_status();

    EXPECT_EQ(status.size(), SYSTEM_TAG_COUNT);
    for (const auto& [tag, system] : status) {
        EXPECT_TRUE(system.available) << to_string(tag);
    }
}
