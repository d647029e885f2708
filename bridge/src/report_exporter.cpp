/**
 * report_exporter.cpp — Implementation (jsoncpp)
 */

#include "report_exporter.hpp"

#include <initializer_list>
#include <memory>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <json/json.h>

namespace therapy_lens {

namespace {

// ── Writing ──────────────────────────────────────────────

Json::Value statistics_to_json(const MetricStatistics& stats) {
    Json::Value out(Json::objectValue);
    out["min"] = stats.min;
    out["max"] = stats.max;
    out["avg"] = stats.avg;
    out["std_dev"] = stats.std_dev;
    out["count"] = static_cast<Json::Int64>(stats.count);
    return out;
}

Json::Value segment_to_json(const TimelineSegment& segment) {
    Json::Value out(Json::objectValue);
    out["start_minute"] = static_cast<Json::Int64>(segment.start_minute);
    out["end_minute"] = static_cast<Json::Int64>(segment.end_minute);
    out["sample_count"] = static_cast<Json::Int64>(segment.sample_count);
    out["avg_eye_contact"] = segment.avg_eye_contact;
    out["avg_gaze_stability"] = segment.avg_gaze_stability;
    out["avg_breathing"] = segment.avg_breathing;
    out["status"] = segment_status_to_string(segment.status);
    out["note"] = segment.note;
    return out;
}

Json::Value alert_to_json(const Alert& alert) {
    Json::Value out(Json::objectValue);
    out["severity"] = alert_severity_to_string(alert.severity);
    out["message"] = alert.message;
    out["minute"] = static_cast<Json::Int64>(alert.minute);
    out["session_elapsed_sec"] = static_cast<Json::Int64>(alert.session_elapsed_sec);
    out["timestamp"] = absl::FormatTime(absl::RFC3339_full, alert.timestamp, absl::UTCTimeZone());
    return out;
}

// ── Reading ──────────────────────────────────────────────

bool has_type(const Json::Value& value, Json::ValueType type) {
    switch (type) {
        case Json::intValue:    return value.isInt64();
        case Json::realValue:   return value.isNumeric();
        case Json::stringValue: return value.isString();
        case Json::objectValue: return value.isObject();
        case Json::arrayValue:  return value.isArray();
        default:                return false;
    }
}

absl::Status require(const Json::Value& obj,
                     const char* context,
                     std::initializer_list<std::pair<const char*, Json::ValueType>> fields) {
    if (!obj.isObject()) {
        return absl::InvalidArgumentError(absl::StrCat(context, " is not an object"));
    }
    for (const auto& [key, type] : fields) {
        if (!obj.isMember(key)) {
            return absl::InvalidArgumentError(absl::StrCat(context, " is missing '", key, "'"));
        }
        if (!has_type(obj[key], type)) {
            return absl::InvalidArgumentError(absl::StrCat(context, ".", key, " has the wrong type"));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<MetricStatistics> statistics_from_json(const Json::Value& obj, const char* context) {
    if (auto status = require(obj, context, {
            {"min", Json::realValue}, {"max", Json::realValue}, {"avg", Json::realValue},
            {"std_dev", Json::realValue}, {"count", Json::intValue}});
        !status.ok()) {
        return status;
    }
    MetricStatistics stats;
    stats.min = obj["min"].asDouble();
    stats.max = obj["max"].asDouble();
    stats.avg = obj["avg"].asDouble();
    stats.std_dev = obj["std_dev"].asDouble();
    stats.count = obj["count"].asInt64();
    return stats;
}

absl::StatusOr<TimelineSegment> segment_from_json(const Json::Value& obj) {
    if (auto status = require(obj, "timeline entry", {
            {"start_minute", Json::intValue}, {"end_minute", Json::intValue},
            {"sample_count", Json::intValue}, {"avg_eye_contact", Json::realValue},
            {"avg_gaze_stability", Json::realValue}, {"avg_breathing", Json::realValue},
            {"status", Json::stringValue}, {"note", Json::stringValue}});
        !status.ok()) {
        return status;
    }
    auto segment_status = segment_status_from_string(obj["status"].asString());
    if (!segment_status) {
        return absl::InvalidArgumentError(
            absl::StrCat("Unknown timeline status '", obj["status"].asString(), "'"));
    }
    TimelineSegment segment;
    segment.start_minute = obj["start_minute"].asInt64();
    segment.end_minute = obj["end_minute"].asInt64();
    segment.sample_count = obj["sample_count"].asInt64();
    segment.avg_eye_contact = obj["avg_eye_contact"].asDouble();
    segment.avg_gaze_stability = obj["avg_gaze_stability"].asDouble();
    segment.avg_breathing = obj["avg_breathing"].asDouble();
    segment.status = *segment_status;
    segment.note = obj["note"].asString();
    return segment;
}

absl::StatusOr<Alert> alert_from_json(const Json::Value& obj) {
    if (auto status = require(obj, "alert", {
            {"severity", Json::stringValue}, {"message", Json::stringValue},
            {"minute", Json::intValue}, {"session_elapsed_sec", Json::intValue},
            {"timestamp", Json::stringValue}});
        !status.ok()) {
        return status;
    }
    auto severity = alert_severity_from_string(obj["severity"].asString());
    if (!severity) {
        return absl::InvalidArgumentError(
            absl::StrCat("Unknown alert severity '", obj["severity"].asString(), "'"));
    }
    Alert alert;
    alert.severity = *severity;
    alert.message = obj["message"].asString();
    alert.minute = obj["minute"].asInt64();
    alert.session_elapsed_sec = obj["session_elapsed_sec"].asInt64();
    std::string err;
    if (!absl::ParseTime(absl::RFC3339_full, obj["timestamp"].asString(), &alert.timestamp, &err)) {
        return absl::InvalidArgumentError(absl::StrCat("Bad alert timestamp: ", err));
    }
    return alert;
}

} // namespace

std::string anonymize_patient_id(absl::string_view patient_id) {
    std::string masked(patient_id);
    const size_t keep = 4;
    for (size_t i = 0; i + keep < masked.size(); ++i) {
        masked[i] = '*';
    }
    return masked;
}

std::string export_report_json(const SessionReport& report,
                               absl::string_view patient_id,
                               const std::vector<Alert>& alerts) {
    Json::Value root(Json::objectValue);
    root["patient_id"] = anonymize_patient_id(patient_id);
    root["duration_sec"] = static_cast<Json::Int64>(report.duration_sec);
    root["alert_count"] = static_cast<Json::Int64>(report.alert_count);
    root["dominant_emotion"] = report.dominant_emotion;
    root["narrative"] = report.narrative;

    Json::Value statistics(Json::objectValue);
    statistics["eye_contact"] = statistics_to_json(report.eye_contact);
    statistics["gaze_stability"] = statistics_to_json(report.gaze_stability);
    statistics["breathing"] = statistics_to_json(report.breathing);
    root["statistics"] = statistics;

    Json::Value insights(Json::objectValue);
    insights["eye_contact"] = report.insights.eye_contact;
    insights["gaze_stability"] = report.insights.gaze_stability;
    insights["breathing"] = report.insights.breathing;
    insights["emotion"] = report.insights.emotion;
    root["insights"] = insights;

    Json::Value emotions(Json::objectValue);
    for (const auto& [label, count] : report.emotion_counts) {
        emotions[label] = static_cast<Json::Int64>(count);
    }
    root["emotion_counts"] = emotions;

    Json::Value timeline(Json::arrayValue);
    for (const auto& segment : report.timeline) {
        timeline.append(segment_to_json(segment));
    }
    root["timeline"] = timeline;

    Json::Value alert_list(Json::arrayValue);
    for (const auto& alert : alerts) {
        alert_list.append(alert_to_json(alert));
    }
    root["alerts"] = alert_list;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["precision"] = 17;
    builder["precisionType"] = "significant";
    return Json::writeString(builder, root);
}

absl::StatusOr<ExportedReport> parse_report_json(absl::string_view text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return absl::InvalidArgumentError(absl::StrCat("Report is not valid JSON: ", errors));
    }

    if (auto status = require(root, "report", {
            {"patient_id", Json::stringValue}, {"duration_sec", Json::intValue},
            {"alert_count", Json::intValue}, {"dominant_emotion", Json::stringValue},
            {"narrative", Json::stringValue}, {"statistics", Json::objectValue},
            {"insights", Json::objectValue}, {"emotion_counts", Json::objectValue},
            {"timeline", Json::arrayValue}, {"alerts", Json::arrayValue}});
        !status.ok()) {
        return status;
    }

    ExportedReport out;
    out.patient_id = root["patient_id"].asString();
    SessionReport& report = out.report;
    report.duration_sec = root["duration_sec"].asInt64();
    report.alert_count = root["alert_count"].asInt64();
    report.dominant_emotion = root["dominant_emotion"].asString();
    report.narrative = root["narrative"].asString();

    const Json::Value& statistics = root["statistics"];
    auto eye = statistics_from_json(statistics["eye_contact"], "statistics.eye_contact");
    if (!eye.ok()) return eye.status();
    auto gaze = statistics_from_json(statistics["gaze_stability"], "statistics.gaze_stability");
    if (!gaze.ok()) return gaze.status();
    auto breathing = statistics_from_json(statistics["breathing"], "statistics.breathing");
    if (!breathing.ok()) return breathing.status();
    report.eye_contact = *eye;
    report.gaze_stability = *gaze;
    report.breathing = *breathing;

    const Json::Value& insights = root["insights"];
    if (auto status = require(insights, "insights", {
            {"eye_contact", Json::stringValue}, {"gaze_stability", Json::stringValue},
            {"breathing", Json::stringValue}, {"emotion", Json::stringValue}});
        !status.ok()) {
        return status;
    }
    report.insights.eye_contact = insights["eye_contact"].asString();
    report.insights.gaze_stability = insights["gaze_stability"].asString();
    report.insights.breathing = insights["breathing"].asString();
    report.insights.emotion = insights["emotion"].asString();

    const Json::Value& emotions = root["emotion_counts"];
    for (const auto& label : emotions.getMemberNames()) {
        if (!emotions[label].isInt64()) {
            return absl::InvalidArgumentError(
                absl::StrCat("emotion_counts.", label, " is not an integer"));
        }
        report.emotion_counts[label] = emotions[label].asInt64();
    }

    for (const auto& entry : root["timeline"]) {
        auto segment = segment_from_json(entry);
        if (!segment.ok()) return segment.status();
        report.timeline.push_back(std::move(*segment));
    }

    for (const auto& entry : root["alerts"]) {
        auto alert = alert_from_json(entry);
        if (!alert.ok()) return alert.status();
        out.alerts.push_back(std::move(*alert));
    }

    return out;
}

} // namespace therapy_lens
