/**
 * session_state_test.cpp — Lifecycle transitions and the elapsed clock
 */

#include "session_state.hpp"

#include <gtest/gtest.h>

#include "clock.hpp"

namespace therapy_lens {
namespace {

class SessionStateTest : public ::testing::Test {
protected:
    ManualClock clock_{10000};
    SessionState session_{clock_};
    Baselines baselines_;
};

TEST_F(SessionStateTest, StartRequiresConsent) {
    auto status = session_.start(false, baselines_);
    EXPECT_EQ(status.code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.phase(), SessionPhase::IDLE);

    ASSERT_TRUE(session_.start(true, baselines_).ok());
    EXPECT_EQ(session_.phase(), SessionPhase::ACTIVE);
    EXPECT_EQ(session_.started_at_ms(), 10000);
}

TEST_F(SessionStateTest, InvalidTransitionsAreRejectedWithoutChange) {
    EXPECT_EQ(session_.pause().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.resume().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.end().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.phase(), SessionPhase::IDLE);

    ASSERT_TRUE(session_.start(true, baselines_).ok());
    EXPECT_EQ(session_.start(true, baselines_).code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.resume().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.phase(), SessionPhase::ACTIVE);

    ASSERT_TRUE(session_.end().ok());
    EXPECT_EQ(session_.pause().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.toggle_pause().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.end().code(), absl::StatusCode::kFailedPrecondition);
    EXPECT_EQ(session_.phase(), SessionPhase::ENDED);
}

TEST_F(SessionStateTest, ElapsedExcludesPausedTime) {
    ASSERT_TRUE(session_.start(true, baselines_).ok());
    clock_.advance_ms(60000);
    EXPECT_EQ(session_.elapsed_sec(), 60);

    ASSERT_TRUE(session_.toggle_pause().ok());
    EXPECT_EQ(session_.phase(), SessionPhase::PAUSED);
    clock_.advance_ms(30000);
    EXPECT_EQ(session_.elapsed_sec(), 60);

    ASSERT_TRUE(session_.toggle_pause().ok());
    EXPECT_EQ(session_.phase(), SessionPhase::ACTIVE);
    EXPECT_EQ(session_.accumulated_paused_ms(), 30000);
    clock_.advance_ms(15000);
    EXPECT_EQ(session_.elapsed_sec(), 75);
}

TEST_F(SessionStateTest, ElapsedAtAnEarlierInstant) {
    ASSERT_TRUE(session_.start(true, baselines_).ok());
    clock_.advance_ms(4000);
    ASSERT_TRUE(session_.pause().ok());
    clock_.advance_ms(10000);
    ASSERT_TRUE(session_.resume().ok());
    clock_.advance_ms(9000);

    // 4 s before the pause plus 6 s after the resume
    EXPECT_EQ(session_.elapsed_ms_at(clock_.now_ms() - 3000), 10000);
    EXPECT_EQ(session_.elapsed_ms(), 13000);
}

TEST_F(SessionStateTest, EndWhilePausedFreezesElapsed) {
    ASSERT_TRUE(session_.start(true, baselines_).ok());
    clock_.advance_ms(20000);
    ASSERT_TRUE(session_.pause().ok());
    clock_.advance_ms(50000);
    ASSERT_TRUE(session_.end().ok());

    EXPECT_EQ(session_.accumulated_paused_ms(), 50000);
    clock_.advance_ms(100000);
    EXPECT_EQ(session_.elapsed_sec(), 20);
}

TEST_F(SessionStateTest, WritesOnlyWhileActive) {
    MetricSample sample;
    EXPECT_FALSE(session_.record_sample(sample).ok());

    ASSERT_TRUE(session_.start(true, baselines_).ok());
    EXPECT_TRUE(session_.record_sample(sample).ok());

    ASSERT_TRUE(session_.pause().ok());
    EXPECT_EQ(session_.record_sample(sample).code(), absl::StatusCode::kFailedPrecondition);
    Alert alert;
    alert.message = "x";
    EXPECT_FALSE(session_.record_alerts({alert}).ok());

    EXPECT_EQ(session_.metrics_history().size(), 1u);
    EXPECT_EQ(session_.alerts().total_emitted(), 0);
}

TEST_F(SessionStateTest, RecordAlertsReturnsOnlyAcceptedOnes) {
    ASSERT_TRUE(session_.start(true, baselines_).ok());
    Alert alert;
    alert.message = "Rapid eye movement suggesting heightened anxiety";
    alert.session_elapsed_sec = 30;

    auto first = session_.record_alerts({alert, alert});
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first->size(), 1u);
    EXPECT_EQ(session_.alerts().entries().size(), 1u);
}

TEST_F(SessionStateTest, ReportAttachesOnceAfterEnd) {
    SessionReport report;
    EXPECT_FALSE(session_.set_report(report).ok());

    ASSERT_TRUE(session_.start(true, baselines_).ok());
    EXPECT_EQ(session_.set_report(report).code(), absl::StatusCode::kFailedPrecondition);

    ASSERT_TRUE(session_.end().ok());
    report.narrative = "first";
    EXPECT_TRUE(session_.set_report(report).ok());
    report.narrative = "second";
    EXPECT_EQ(session_.set_report(report).code(), absl::StatusCode::kAlreadyExists);
    ASSERT_TRUE(session_.report().has_value());
    EXPECT_EQ(session_.report()->narrative, "first");
}

TEST_F(SessionStateTest, BaselinesAreFixedAtStart) {
    Baselines custom;
    custom.baseline_breathing_bpm = 12.0f;
    custom.baseline_eye_contact_pct = 50.0f;
    ASSERT_TRUE(session_.start(true, custom).ok());
    EXPECT_FLOAT_EQ(session_.baselines().baseline_breathing_bpm, 12.0f);
    EXPECT_FLOAT_EQ(session_.baselines().baseline_eye_contact_pct, 50.0f);
}

TEST(SessionPhaseTest, ToString) {
    EXPECT_STREQ(session_phase_to_string(SessionPhase::IDLE), "idle");
    EXPECT_STREQ(session_phase_to_string(SessionPhase::ACTIVE), "active");
    EXPECT_STREQ(session_phase_to_string(SessionPhase::PAUSED), "paused");
    EXPECT_STREQ(session_phase_to_string(SessionPhase::ENDED), "ended");
}

} // namespace
} // namespace therapy_lens
