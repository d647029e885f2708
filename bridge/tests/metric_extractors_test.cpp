/**
 * metric_extractors_test.cpp — Eye contact, gaze, breathing and emotion
 */

#include "metric_extractors.hpp"

#include <cmath>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace therapy_lens {
namespace {

constexpr double kPi = 3.14159265358979323846;

LandmarkSnapshot face_at(int64_t t_ms, float nose_x, float nose_y, float lip_y = 0.0f) {
    LandmarkSnapshot snapshot;
    snapshot.captured_at_ms = t_ms;
    snapshot.frame_width = 640;
    snapshot.frame_height = 480;
    snapshot.points[landmarks::kNoseTip] = Point2{nose_x, nose_y};
    snapshot.points[landmarks::kUpperLip] = Point2{nose_x, lip_y};
    return snapshot;
}

// ── Eye contact ──────────────────────────────────────────

TEST(EyeContactExtractorTest, CenteredFaceIsFullContact) {
    EyeContactExtractor eye(ExtractorConfig{});
    EXPECT_FLOAT_EQ(eye.update(face_at(0, 320, 240)), 100.0f);
}

TEST(EyeContactExtractorTest, UnmeasuredValueIsTheSeedNotZero) {
    EyeContactExtractor eye(ExtractorConfig{});
    EXPECT_FALSE(eye.has_measurement());
    EXPECT_FLOAT_EQ(eye.value(), 65.0f);

    eye.seed(80.0f);
    EXPECT_FLOAT_EQ(eye.value(), 80.0f);

    eye.update(face_at(0, 384, 240));
    EXPECT_TRUE(eye.has_measurement());
    eye.seed(80.0f);
    EXPECT_FLOAT_EQ(eye.value(), 75.0f);
}

TEST(EyeContactExtractorTest, OffsetLowersContactAndClampsAtZero) {
    EyeContactExtractor eye(ExtractorConfig{});
    // 64 px right of center = 10 points of deviation
    EXPECT_FLOAT_EQ(eye.update(face_at(0, 384, 240)), 75.0f);
    EXPECT_FLOAT_EQ(eye.update(face_at(33, 0, 0)), 0.0f);
}

TEST(EyeContactExtractorTest, HoldsLastValueOnMissingInput) {
    EyeContactExtractor eye(ExtractorConfig{});
    eye.update(face_at(0, 384, 240));

    LandmarkSnapshot no_nose;
    no_nose.frame_width = 640;
    no_nose.frame_height = 480;
    EXPECT_FLOAT_EQ(eye.update(no_nose), 75.0f);

    LandmarkSnapshot no_size = face_at(33, 320, 240);
    no_size.frame_width = 0;
    EXPECT_FLOAT_EQ(eye.update(no_size), 75.0f);
}

// ── Gaze stability ───────────────────────────────────────

TEST(GazeStabilityExtractorTest, ReportsDefaultUntilWindowFills) {
    GazeStabilityExtractor gaze(ExtractorConfig{});
    EXPECT_FLOAT_EQ(gaze.value(), 90.0f);
    for (int i = 0; i < 9; ++i) {
        // Wildly moving nose, but too few samples to judge
        EXPECT_FLOAT_EQ(gaze.update(face_at(i * 33, i % 2 ? 0.0f : 600.0f, 240)), 90.0f);
    }
}

TEST(GazeStabilityExtractorTest, SteadyNoseIsFullyStable) {
    GazeStabilityExtractor gaze(ExtractorConfig{});
    for (int i = 0; i < 10; ++i) {
        gaze.update(face_at(i * 33, 320, 240));
    }
    EXPECT_FLOAT_EQ(gaze.value(), 100.0f);
}

TEST(GazeStabilityExtractorTest, SpreadLowersStability) {
    GazeStabilityExtractor gaze(ExtractorConfig{});
    for (int i = 0; i < 10; ++i) {
        gaze.update(face_at(i * 33, i % 2 ? 300.0f : 340.0f, 240));
    }
    // Mean distance from centroid is 20 px, at 4 points per px
    EXPECT_FLOAT_EQ(gaze.value(), 20.0f);
}

TEST(GazeStabilityExtractorTest, WindowDropsOldPositions) {
    ExtractorConfig config;
    GazeStabilityExtractor gaze(config);
    for (int i = 0; i < 10; ++i) {
        gaze.update(face_at(i * 33, i % 2 ? 300.0f : 340.0f, 240));
    }
    // Well past the 2 s window the jitter is forgotten
    for (int i = 0; i < 30; ++i) {
        gaze.update(face_at(3000 + i * 100, 320, 240));
    }
    EXPECT_LT(gaze.window_size(), 30u);
    EXPECT_FLOAT_EQ(gaze.value(), 100.0f);
}

// ── Breathing ────────────────────────────────────────────

TEST(BreathingExtractorTest, CountPeaks) {
    EXPECT_EQ(BreathingExtractor::count_peaks({1, 3}, 0.01f, 0), 0);
    EXPECT_EQ(BreathingExtractor::count_peaks({2, 2, 2, 2, 2}, 0.01f, 0), 0);
    EXPECT_EQ(BreathingExtractor::count_peaks({1, 3, 1, 3, 1, 3, 1}, 0.01f, 0), 3);
    // The refractory gap swallows the peak at index 3
    EXPECT_EQ(BreathingExtractor::count_peaks({1, 3, 1, 3, 1, 3, 1}, 0.01f, 3), 2);
    // Local maxima below mean * (1 + eps) do not count
    EXPECT_EQ(BreathingExtractor::count_peaks({1, 1.5f, 1, 9, 1, 1, 1}, 0.01f, 0), 1);
}

TEST(BreathingExtractorTest, HoldsInitialEstimateUntilEnoughSamples) {
    BreathingExtractor breathing(ExtractorConfig{});
    EXPECT_FLOAT_EQ(breathing.value(), 14.0f);
    for (int i = 0; i < 49; ++i) {
        EXPECT_FLOAT_EQ(breathing.update(face_at(i * 100, 320, 240, 260)), 14.0f);
    }

    // Flat signal: no peaks, raw clamps to 8, averaged with 14
    EXPECT_FLOAT_EQ(breathing.update(face_at(4900, 320, 240, 260)), 11.0f);
    EXPECT_FLOAT_EQ(breathing.update(face_at(5000, 320, 240, 260)), 9.5f);
}

TEST(BreathingExtractorTest, TracksPeriodicSignalWithinBounds) {
    BreathingExtractor breathing(ExtractorConfig{});
    // 20 breaths/min: one cycle every 3 s, sampled at 20 fps for 30 s
    for (int64_t t = 0; t <= 30000; t += 50) {
        const float separation = 20.0f + 5.0f * static_cast<float>(std::sin(2.0 * kPi * t / 3000.0));
        breathing.update(face_at(t, 320, 240, 240 + separation));
    }
    EXPECT_GT(breathing.value(), 16.0f);
    EXPECT_LE(breathing.value(), 30.0f);
    EXPECT_LE(breathing.window_size(), 200u);
}

TEST(BreathingExtractorTest, HoldsWhenUpperLipMissing) {
    BreathingExtractor breathing(ExtractorConfig{});
    LandmarkSnapshot nose_only = face_at(0, 320, 240);
    nose_only.points.erase(landmarks::kUpperLip);
    for (int i = 0; i < 100; ++i) {
        nose_only.captured_at_ms = i * 33;
        breathing.update(nose_only);
    }
    EXPECT_EQ(breathing.window_size(), 0u);
    EXPECT_FLOAT_EQ(breathing.value(), 14.0f);
}

TEST(MetricExtractorsTest, OutputsStayWithinBoundsForArbitraryMotion) {
    MetricExtractors extractors;
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> x(-200.0f, 840.0f);
    std::uniform_real_distribution<float> y(-200.0f, 680.0f);

    for (int64_t t = 0; t < 60000; t += 33) {
        extractors.update(face_at(t, x(rng), y(rng), y(rng)));
        ASSERT_GE(extractors.eye_contact_pct(), 0.0f);
        ASSERT_LE(extractors.eye_contact_pct(), 100.0f);
        ASSERT_GE(extractors.gaze_stability_pct(), 0.0f);
        ASSERT_LE(extractors.gaze_stability_pct(), 100.0f);
        ASSERT_GE(extractors.breathing_bpm(), 8.0f);
        ASSERT_LE(extractors.breathing_bpm(), 30.0f);
    }
}

// ── Emotion ──────────────────────────────────────────────

TEST(NormalizeExpressionsTest, RemainderGoesToNeutral) {
    EmotionDistribution d = normalize_expressions({{"happy", 0.6f}});
    EXPECT_EQ(d.dominant, "happy");
    EXPECT_FLOAT_EQ(d.confidence, 0.6f);
    EXPECT_FLOAT_EQ(d.scores["neutral"], 0.4f);
    EXPECT_EQ(d.scores.size(), known_emotion_labels().size());
}

TEST(NormalizeExpressionsTest, ScalesDownWhenSumExceedsOne) {
    EmotionDistribution d = normalize_expressions({{"Happy", 0.8f}, {"sad", 0.8f}});
    EXPECT_FLOAT_EQ(d.scores["happy"], 0.5f);
    EXPECT_FLOAT_EQ(d.scores["sad"], 0.5f);
    EXPECT_FLOAT_EQ(d.scores["neutral"], 0.0f);
    // Tie resolved in label order
    EXPECT_EQ(d.dominant, "happy");
}

TEST(NormalizeExpressionsTest, NeutralWinsTies) {
    EmotionDistribution d = normalize_expressions({{"happy", 0.5f}});
    EXPECT_EQ(d.dominant, "neutral");
    EXPECT_FLOAT_EQ(d.confidence, 0.5f);
}

TEST(NormalizeExpressionsTest, ClampsAndDropsUnknownLabels) {
    EmotionDistribution d = normalize_expressions(
        {{"angry", 1.7f}, {"sad", -0.2f}, {"confused", 0.9f}});
    EXPECT_EQ(d.dominant, "angry");
    EXPECT_FLOAT_EQ(d.confidence, 1.0f);
    EXPECT_FLOAT_EQ(d.scores["sad"], 0.0f);
    EXPECT_EQ(d.scores.count("confused"), 0u);

    float total = 0.0f;
    for (const auto& [label, score] : d.scores) total += score;
    EXPECT_NEAR(total, 1.0f, 1e-6);
}

TEST(EmotionExtractorTest, SnapshotWithoutScoresReadsNeutralLowConfidence) {
    EmotionExtractor emotion;
    EXPECT_EQ(emotion.dominant_emotion(), "neutral");
    EXPECT_FLOAT_EQ(emotion.confidence(), 0.0f);

    LandmarkSnapshot snapshot = face_at(0, 320, 240);
    snapshot.expression_scores = std::map<std::string, float>{{"sad", 0.9f}};
    emotion.update(snapshot);
    EXPECT_EQ(emotion.dominant_emotion(), "sad");
    EXPECT_FLOAT_EQ(emotion.confidence(), 0.9f);

    snapshot.expression_scores.reset();
    emotion.update(snapshot);
    EXPECT_FALSE(emotion.distribution().has_value());
    EXPECT_EQ(emotion.dominant_emotion(), "neutral");
    EXPECT_FLOAT_EQ(emotion.confidence(), 0.0f);
}

TEST(MetricExtractorsTest, UpdatesAllFourTogether) {
    MetricExtractors extractors;
    LandmarkSnapshot snapshot = face_at(0, 384, 240, 270);
    snapshot.expression_scores = std::map<std::string, float>{{"surprised", 0.7f}};
    extractors.update(snapshot);

    EXPECT_FLOAT_EQ(extractors.eye_contact_pct(), 75.0f);
    EXPECT_FLOAT_EQ(extractors.gaze_stability_pct(), 90.0f);
    EXPECT_FLOAT_EQ(extractors.breathing_bpm(), 14.0f);
    EXPECT_EQ(extractors.emotion().dominant_emotion(), "surprised");
    EXPECT_EQ(extractors.breathing().window_size(), 1u);
}

TEST(ExtractorConfigTest, RejectsCountsAndWindowsOutOfRange) {
    EXPECT_TRUE(validate_extractor_config(ExtractorConfig{}).ok());

    ExtractorConfig config;
    config.gaze_min_samples = -1;
    EXPECT_EQ(validate_extractor_config(config).code(), absl::StatusCode::kInvalidArgument);

    config = ExtractorConfig{};
    config.breathing_min_samples = 0;
    EXPECT_EQ(validate_extractor_config(config).code(), absl::StatusCode::kInvalidArgument);

    config = ExtractorConfig{};
    config.breathing_window_ms = 0;
    EXPECT_EQ(validate_extractor_config(config).code(), absl::StatusCode::kInvalidArgument);

    config = ExtractorConfig{};
    config.peak_refractory = -2;
    EXPECT_EQ(validate_extractor_config(config).code(), absl::StatusCode::kInvalidArgument);
}

} // namespace
} // namespace therapy_lens
