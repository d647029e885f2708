/**
 * alert_evaluator.cpp — Implementation
 */

#include "alert_evaluator.hpp"

#include <algorithm>
#include <utility>

#include <absl/strings/str_format.h>

namespace therapy_lens {

const char* alert_severity_to_string(AlertSeverity severity) {
    switch (severity) {
        case AlertSeverity::WARNING:  return "warning";
        case AlertSeverity::CRITICAL: return "critical";
        default:                      return "warning";
    }
}

std::optional<AlertSeverity> alert_severity_from_string(absl::string_view text) {
    if (text == "warning")  return AlertSeverity::WARNING;
    if (text == "critical") return AlertSeverity::CRITICAL;
    return std::nullopt;
}

std::vector<Alert> evaluate_alerts(
    const MetricSample& sample,
    const Baselines& baselines,
    int64_t session_elapsed_sec,
    absl::Time now,
    const AlertThresholds& thresholds
) {
    std::vector<Alert> alerts;

    auto raise = [&](AlertSeverity severity, std::string message) {
        Alert alert;
        alert.severity = severity;
        alert.message = std::move(message);
        alert.session_elapsed_sec = session_elapsed_sec;
        alert.minute = session_elapsed_sec / 60;
        alert.timestamp = now;
        alerts.push_back(std::move(alert));
    };

    // ── Breathing ────────────────────────────────────────
    if (sample.breathing_bpm > thresholds.hyperventilation_bpm) {
        raise(AlertSeverity::CRITICAL,
              absl::StrFormat("Hyperventilation detected (%.1f breaths/min)", sample.breathing_bpm));
    } else if (sample.breathing_bpm >
               baselines.baseline_breathing_bpm * thresholds.breathing_increase_factor) {
        raise(AlertSeverity::WARNING,
              absl::StrFormat("Breathing rate increased %.0f%% (%.1f bpm)",
                              (thresholds.breathing_increase_factor - 1.0f) * 100.0f,
                              sample.breathing_bpm));
    }

    // ── Eye contact ──────────────────────────────────────
    if (sample.eye_contact_pct < thresholds.minimal_eye_contact_pct &&
        session_elapsed_sec > thresholds.minimal_eye_contact_after_sec) {
        raise(AlertSeverity::WARNING,
              absl::StrFormat("Minimal eye contact for extended period (%.0f%%)",
                              sample.eye_contact_pct));
    }

    // ── Gaze ─────────────────────────────────────────────
    if (sample.gaze_stability_pct > thresholds.dissociation_gaze_pct &&
        session_elapsed_sec > thresholds.dissociation_after_sec) {
        raise(AlertSeverity::WARNING, "Gaze patterns suggest possible dissociation");
    }
    if (sample.gaze_stability_pct < thresholds.anxiety_gaze_pct) {
        raise(AlertSeverity::WARNING, "Rapid eye movement suggesting heightened anxiety");
    }

    return alerts;
}

AlertLog::AlertLog(size_t capacity, int64_t dedup_window_sec)
    : capacity_(std::max<size_t>(1, capacity))
    , dedup_window_sec_(dedup_window_sec)
{
}

bool AlertLog::append(const Alert& alert) {
    auto it = last_emitted_sec_.find(alert.message);
    if (it != last_emitted_sec_.end() &&
        alert.session_elapsed_sec - it->second < dedup_window_sec_) {
        return false;
    }
    last_emitted_sec_[alert.message] = alert.session_elapsed_sec;

    entries_.push_back(alert);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
    }
    ++total_emitted_;
    return true;
}

std::vector<std::string> AlertLog::recent_messages(size_t count) const {
    std::vector<std::string> messages;
    for (auto it = entries_.rbegin(); it != entries_.rend() && messages.size() < count; ++it) {
        messages.push_back(it->message);
    }
    return messages;
}

} // namespace therapy_lens
