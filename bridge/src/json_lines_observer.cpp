/**
 * json_lines_observer.cpp — Implementation
 */

#include "json_lines_observer.hpp"

#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

#include <absl/time/time.h>

#include "report_exporter.hpp"

namespace therapy_lens {

std::string sample_to_json_line(const MetricSample& sample) {
    std::ostringstream json;
    json << std::fixed << std::setprecision(1);
    json << "{";
    json << "\"elapsed_sec\":" << sample.session_elapsed_sec;
    json << ",\"eye_contact_pct\":" << sample.eye_contact_pct;
    json << ",\"gaze_stability_pct\":" << sample.gaze_stability_pct;
    json << ",\"breathing_bpm\":" << sample.breathing_bpm;
    json << ",\"dominant_emotion\":\"" << JsonEmitter::escape_json_string(sample.dominant_emotion) << "\"";
    json << std::setprecision(3);
    json << ",\"emotion_confidence\":" << sample.emotion_confidence;
    json << "}";
    return json.str();
}

std::string alert_to_json_line(const Alert& alert) {
    std::ostringstream json;
    json << "{";
    json << "\"severity\":\"" << alert_severity_to_string(alert.severity) << "\"";
    json << ",\"message\":\"" << JsonEmitter::escape_json_string(alert.message) << "\"";
    json << ",\"minute\":" << alert.minute;
    json << ",\"elapsed_sec\":" << alert.session_elapsed_sec;
    json << ",\"timestamp\":\""
         << absl::FormatTime(absl::RFC3339_full, alert.timestamp, absl::UTCTimeZone()) << "\"";
    json << "}";
    return json.str();
}

JsonLinesObserver::JsonLinesObserver(JsonEmitter& emitter, std::string patient_id)
    : emitter_(emitter)
    , patient_id_(std::move(patient_id))
{
}

void JsonLinesObserver::on_state_changed(SessionPhase phase, int64_t elapsed_sec) {
    std::ostringstream json;
    json << "{\"state\":\"" << session_phase_to_string(phase) << "\""
         << ",\"elapsed_sec\":" << elapsed_sec << "}";
    emitter_.emit("state", json.str());
}

void JsonLinesObserver::on_sample(const MetricSample& sample) {
    emitter_.emit("sample", sample_to_json_line(sample));
}

void JsonLinesObserver::on_alert(const Alert& alert) {
    emitter_.emit("alert", alert_to_json_line(alert));
}

void JsonLinesObserver::on_report(const SessionReport& report, const AlertLog& alerts) {
    std::vector<Alert> entries(alerts.entries().begin(), alerts.entries().end());
    emitter_.emit("report", export_report_json(report, patient_id_, entries));
}

} // namespace therapy_lens
