/**
 * report_exporter_test.cpp — Anonymized JSON export and parse-back
 */

#include "report_exporter.hpp"

#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <json/json.h>

namespace therapy_lens {
namespace {

SessionReport sample_report() {
    std::vector<MetricSample> history;
    for (int64_t t = 0; t < 600; t += 3) {
        MetricSample sample;
        sample.session_elapsed_sec = t;
        sample.eye_contact_pct = 40.0f + static_cast<float>(t % 37);
        sample.gaze_stability_pct = 61.0f;
        sample.breathing_bpm = 13.7f + static_cast<float>(t % 5) * 0.3f;
        sample.dominant_emotion = t < 300 ? "neutral" : "sad";
        history.push_back(sample);
    }
    SessionReport report = aggregate_report(history, 603, 2, Baselines{});
    report.narrative = "Engagement dipped mid-session.\nBreathing stayed \"near\" baseline.";
    return report;
}

std::vector<Alert> sample_alerts() {
    Alert critical;
    critical.severity = AlertSeverity::CRITICAL;
    critical.message = "Hyperventilation detected (27.0 breaths/min)";
    critical.session_elapsed_sec = 312;
    critical.minute = 5;
    critical.timestamp = absl::FromUnixMillis(1700000312123);

    Alert warning;
    warning.message = "Minimal eye contact for extended period (12%)";
    warning.session_elapsed_sec = 450;
    warning.minute = 7;
    warning.timestamp = absl::FromUnixMillis(1700000450000);
    return {critical, warning};
}

TEST(AnonymizePatientIdTest, KeepsLastFourCharacters) {
    EXPECT_EQ(anonymize_patient_id("PT-00123456"), "*******3456");
    EXPECT_EQ(anonymize_patient_id("12345"), "*2345");
    EXPECT_EQ(anonymize_patient_id("abc"), "abc");
    EXPECT_EQ(anonymize_patient_id(""), "");
}

TEST(ReportExporterTest, ExportIsFlatJsonWithMaskedId) {
    const std::string text = export_report_json(sample_report(), "patient-9876", sample_alerts());
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(text.find("patient-9876"), std::string::npos);

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    ASSERT_TRUE(reader->parse(text.data(), text.data() + text.size(), &root, &errors)) << errors;

    EXPECT_EQ(root["patient_id"].asString(), "********9876");
    EXPECT_EQ(root["alert_count"].asInt64(), 2);
    EXPECT_EQ(root["timeline"].size(), 2u);
    EXPECT_EQ(root["alerts"][0]["severity"].asString(), "critical");
    EXPECT_EQ(root["alerts"][0]["timestamp"].asString(), "2023-11-14T22:18:32.123+00:00");
    EXPECT_EQ(root["emotion_counts"]["sad"].asInt64(), 100);
}

TEST(ReportExporterTest, ParseRestoresWhatWasExported) {
    const SessionReport original = sample_report();
    const std::vector<Alert> alerts = sample_alerts();

    auto parsed = parse_report_json(export_report_json(original, "patient-9876", alerts));
    ASSERT_TRUE(parsed.ok()) << parsed.status();

    EXPECT_EQ(parsed->patient_id, "********9876");
    const SessionReport& report = parsed->report;
    EXPECT_EQ(report.duration_sec, 603);
    EXPECT_EQ(report.alert_count, 2);
    EXPECT_EQ(report.narrative, original.narrative);
    EXPECT_EQ(report.dominant_emotion, original.dominant_emotion);
    EXPECT_EQ(report.emotion_counts, original.emotion_counts);

    // 17 significant digits: doubles come back bit-for-bit
    EXPECT_EQ(report.eye_contact.avg, original.eye_contact.avg);
    EXPECT_EQ(report.eye_contact.std_dev, original.eye_contact.std_dev);
    EXPECT_EQ(report.breathing.avg, original.breathing.avg);
    EXPECT_EQ(report.breathing.count, original.breathing.count);

    EXPECT_EQ(report.insights.breathing, original.insights.breathing);
    ASSERT_EQ(report.timeline.size(), original.timeline.size());
    EXPECT_EQ(report.timeline[1].status, original.timeline[1].status);
    EXPECT_EQ(report.timeline[1].note, original.timeline[1].note);
    EXPECT_EQ(report.timeline[1].avg_breathing, original.timeline[1].avg_breathing);

    ASSERT_EQ(parsed->alerts.size(), 2u);
    EXPECT_EQ(parsed->alerts[0].severity, AlertSeverity::CRITICAL);
    EXPECT_EQ(parsed->alerts[0].message, alerts[0].message);
    EXPECT_EQ(parsed->alerts[0].timestamp, alerts[0].timestamp);
    EXPECT_EQ(parsed->alerts[1].minute, 7);
}

TEST(ReportExporterTest, ParseRejectsMalformedDocuments) {
    EXPECT_EQ(parse_report_json("not json").status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(parse_report_json("[]").status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(parse_report_json("{\"patient_id\":\"****1234\"}").status().code(),
              absl::StatusCode::kInvalidArgument);

    std::string text = export_report_json(sample_report(), "id", {});
    const std::string good_status = "\"status\":\"stable\"";
    const size_t at = text.find(good_status);
    ASSERT_NE(at, std::string::npos);
    text.replace(at, good_status.size(), "\"status\":\"calm\"");
    EXPECT_EQ(parse_report_json(text).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ReportExporterTest, WrongFieldTypeIsRejected) {
    std::string text = export_report_json(sample_report(), "id", {});
    const std::string duration = "\"duration_sec\":603";
    const size_t at = text.find(duration);
    ASSERT_NE(at, std::string::npos);
    text.replace(at, duration.size(), "\"duration_sec\":\"603\"");

    auto parsed = parse_report_json(text);
    ASSERT_FALSE(parsed.ok());
    EXPECT_NE(parsed.status().message().find("duration_sec"), absl::string_view::npos);
}

} // namespace
} // namespace therapy_lens
