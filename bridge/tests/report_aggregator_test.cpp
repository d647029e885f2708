/**
 * report_aggregator_test.cpp — Statistics, insights and timeline
 */

#include "report_aggregator.hpp"

#include <initializer_list>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "alert_evaluator.hpp"

namespace therapy_lens {
namespace {

MetricSample sample_at(int64_t elapsed_sec, float eye, float gaze, float breathing,
                       const std::string& emotion = "neutral") {
    MetricSample sample;
    sample.session_elapsed_sec = elapsed_sec;
    sample.eye_contact_pct = eye;
    sample.gaze_stability_pct = gaze;
    sample.breathing_bpm = breathing;
    sample.dominant_emotion = emotion;
    return sample;
}

TEST(ComputeStatisticsTest, PopulationStandardDeviation) {
    MetricStatistics stats = compute_statistics({2, 4, 4, 4, 5, 5, 7, 9});
    EXPECT_EQ(stats.count, 8);
    EXPECT_DOUBLE_EQ(stats.min, 2.0);
    EXPECT_DOUBLE_EQ(stats.max, 9.0);
    EXPECT_DOUBLE_EQ(stats.avg, 5.0);
    EXPECT_DOUBLE_EQ(stats.std_dev, 2.0);
}

TEST(ComputeStatisticsTest, EmptyIsAllZero) {
    MetricStatistics stats = compute_statistics({});
    EXPECT_EQ(stats.count, 0);
    EXPECT_DOUBLE_EQ(stats.avg, 0.0);
    EXPECT_DOUBLE_EQ(stats.std_dev, 0.0);
}

TEST(AggregateReportTest, ZeroSamplesYieldsNoDataReport) {
    SessionReport report = aggregate_report({}, 95, 0, Baselines{});

    EXPECT_EQ(report.duration_sec, 95);
    EXPECT_EQ(report.eye_contact.count, 0);
    EXPECT_DOUBLE_EQ(report.breathing.avg, 0.0);
    EXPECT_EQ(report.dominant_emotion, "neutral");
    EXPECT_TRUE(report.emotion_counts.empty());
    EXPECT_EQ(report.insights.eye_contact, "No data collected");
    EXPECT_EQ(report.insights.emotion, "No data collected");

    ASSERT_EQ(report.timeline.size(), 1u);
    EXPECT_EQ(report.timeline[0].status, SegmentStatus::NO_DATA);
    EXPECT_EQ(report.timeline[0].note, "No data collected");
    EXPECT_EQ(report.timeline[0].end_minute, 1);
}

TEST(AggregateReportTest, SteadyTwentyMinuteSession) {
    Baselines baselines;
    AlertLog log;
    std::vector<MetricSample> history;
    for (int64_t i = 0; i < 400; ++i) {
        MetricSample sample = sample_at(i * 3, 65.0f, 75.0f, 15.0f);
        for (const auto& alert : evaluate_alerts(sample, baselines, sample.session_elapsed_sec,
                                                 absl::UnixEpoch())) {
            log.append(alert);
        }
        history.push_back(sample);
    }
    EXPECT_EQ(log.total_emitted(), 0);

    SessionReport report = aggregate_report(history, 1200, log.total_emitted(), baselines);
    EXPECT_EQ(report.alert_count, 0);
    EXPECT_DOUBLE_EQ(report.eye_contact.avg, 65.0);
    EXPECT_DOUBLE_EQ(report.gaze_stability.avg, 75.0);
    EXPECT_DOUBLE_EQ(report.breathing.avg, 15.0);
    EXPECT_DOUBLE_EQ(report.eye_contact.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(report.gaze_stability.std_dev, 0.0);
    EXPECT_DOUBLE_EQ(report.breathing.std_dev, 0.0);
    EXPECT_EQ(report.breathing.count, 400);

    EXPECT_EQ(report.insights.breathing,
              "Breathing averaged 15.0 bpm, within the normal range of the 14.0 bpm baseline.");
    EXPECT_EQ(report.insights.eye_contact,
              "Eye contact averaged 65%, at or above the 65% baseline, suggesting good engagement.");
    EXPECT_EQ(report.insights.gaze_stability, "Gaze stability averaged 75%, within a typical range.");
    EXPECT_EQ(report.insights.emotion, "Predominant expression: neutral (400 of 400 samples).");

    ASSERT_EQ(report.timeline.size(), 4u);
    for (size_t i = 0; i < report.timeline.size(); ++i) {
        const TimelineSegment& segment = report.timeline[i];
        EXPECT_EQ(segment.start_minute, static_cast<int64_t>(5 * i));
        EXPECT_EQ(segment.end_minute, static_cast<int64_t>(5 * (i + 1)));
        EXPECT_EQ(segment.sample_count, 100);
        EXPECT_EQ(segment.status, SegmentStatus::STABLE);
        EXPECT_EQ(segment.note, "All indicators within expected ranges");
    }
}

TEST(AggregateReportTest, TimelineListsOnlySegmentsWithSamples) {
    std::vector<MetricSample> history;
    for (int64_t t = 0; t < 300; t += 3) history.push_back(sample_at(t, 70, 70, 14));
    for (int64_t t = 900; t < 1200; t += 3) history.push_back(sample_at(t, 70, 70, 14));

    SessionReport report = aggregate_report(history, 1200, 0, Baselines{});
    ASSERT_EQ(report.timeline.size(), 2u);
    EXPECT_EQ(report.timeline[0].start_minute, 0);
    EXPECT_EQ(report.timeline[1].start_minute, 15);
    EXPECT_EQ(report.timeline[1].end_minute, 20);
}

TEST(AggregateReportTest, ClassifiesSegments) {
    std::vector<MetricSample> history;
    // 0-5 min: hyperventilating with a fixed gaze
    for (int64_t t = 0; t < 300; t += 3) history.push_back(sample_at(t, 70, 97, 26));
    // 5-10 min: breathing somewhat above baseline
    for (int64_t t = 300; t < 600; t += 3) history.push_back(sample_at(t, 70, 70, 16.5f));
    // 10-15 min: engagement swinging between 30 and 100
    for (int64_t t = 600; t < 900; t += 3) {
        history.push_back(sample_at(t, (t / 3) % 2 ? 30.0f : 100.0f, 70, 14));
    }
    // 15-20 min: calm
    for (int64_t t = 900; t < 1200; t += 3) history.push_back(sample_at(t, 70, 70, 14));

    SessionReport report = aggregate_report(history, 1200, 0, Baselines{});
    ASSERT_EQ(report.timeline.size(), 4u);

    EXPECT_EQ(report.timeline[0].status, SegmentStatus::NOTABLE_MARKERS);
    EXPECT_EQ(report.timeline[0].note, "elevated breathing; fixed gaze");

    EXPECT_EQ(report.timeline[1].status, SegmentStatus::MILD_VARIATION);
    EXPECT_EQ(report.timeline[1].note, "breathing above baseline");

    EXPECT_EQ(report.timeline[2].status, SegmentStatus::MILD_VARIATION);
    EXPECT_EQ(report.timeline[2].note, "variable eye contact");
    EXPECT_DOUBLE_EQ(report.timeline[2].avg_eye_contact, 65.0);

    EXPECT_EQ(report.timeline[3].status, SegmentStatus::STABLE);
}

TEST(AggregateReportTest, CountsEmotionsAndPicksMostFrequent) {
    std::vector<MetricSample> history = {
        sample_at(3, 70, 70, 14, "happy"),
        sample_at(6, 70, 70, 14, "sad"),
        sample_at(9, 70, 70, 14, "happy"),
        sample_at(12, 70, 70, 14, "sad"),
        sample_at(15, 70, 70, 14, "happy"),
    };
    SessionReport report = aggregate_report(history, 15, 2, Baselines{});
    EXPECT_EQ(report.emotion_counts.at("happy"), 3);
    EXPECT_EQ(report.emotion_counts.at("sad"), 2);
    EXPECT_EQ(report.dominant_emotion, "happy");
    EXPECT_EQ(report.alert_count, 2);
    EXPECT_EQ(report.insights.emotion, "Predominant expression: happy (3 of 5 samples).");
}

TEST(AggregateReportTest, InsightTextFollowsBaselines) {
    std::vector<MetricSample> history;
    for (int64_t t = 0; t < 60; t += 3) {
        history.push_back(sample_at(t, 10, 20, (t / 3) % 2 ? 12.0f : 28.0f));
    }
    SessionReport report = aggregate_report(history, 60, 0, Baselines{});

    EXPECT_NE(report.insights.breathing.find("sustained stress"), std::string::npos);
    EXPECT_NE(report.insights.breathing.find("highly variable"), std::string::npos);
    EXPECT_NE(report.insights.eye_contact.find("minimal throughout"), std::string::npos);
    EXPECT_NE(report.insights.gaze_stability.find("heightened anxiety"), std::string::npos);
}

TEST(SegmentStatusTest, StringsRoundTrip) {
    for (SegmentStatus status : {SegmentStatus::STABLE, SegmentStatus::MILD_VARIATION,
                                 SegmentStatus::NOTABLE_MARKERS, SegmentStatus::NO_DATA}) {
        auto parsed = segment_status_from_string(segment_status_to_string(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_FALSE(segment_status_from_string("Stable").has_value());
}

} // namespace
} // namespace therapy_lens
