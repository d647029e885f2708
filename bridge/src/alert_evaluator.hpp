/**
 * alert_evaluator.hpp — Clinical alerts from the latest metric sample
 *
 * Rules (independent; several may fire on one sample):
 *   CRITICAL — breathing above the hyperventilation threshold
 *   WARNING  — otherwise, breathing 50% above the patient's baseline
 *   WARNING  — minimal eye contact, once the session is past its warm-up
 *   WARNING  — near-frozen gaze late in a session (possible dissociation)
 *   WARNING  — very unstable gaze (heightened anxiety)
 *
 * The evaluator itself is stateless. AlertLog applies the dedup window
 * and the size cap.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>
#include <absl/time/time.h>

#include "metric_sample.hpp"

namespace therapy_lens {

enum class AlertSeverity {
    WARNING,
    CRITICAL
};

/**
 * Convert AlertSeverity enum to a string for JSON output.
 */
const char* alert_severity_to_string(AlertSeverity severity);

std::optional<AlertSeverity> alert_severity_from_string(absl::string_view text);

struct Alert {
    AlertSeverity severity = AlertSeverity::WARNING;
    std::string message;
    int64_t minute = 0;               // session_elapsed_sec / 60
    int64_t session_elapsed_sec = 0;
    absl::Time timestamp;             // wall-clock creation time
};

/**
 * Configurable thresholds for alerting.
 */
struct AlertThresholds {
    // Breathing: above this is hyperventilation regardless of baseline
    float hyperventilation_bpm = 25.0f;

    // Breathing: multiple of baseline that counts as a sharp increase
    float breathing_increase_factor = 1.5f;

    // Eye contact: below this for long enough is "minimal"
    float minimal_eye_contact_pct = 20.0f;
    int64_t minimal_eye_contact_after_sec = 45;

    // Gaze: above this late in a session suggests dissociation
    float dissociation_gaze_pct = 95.0f;
    int64_t dissociation_after_sec = 90;

    // Gaze: below this suggests anxiety
    float anxiety_gaze_pct = 30.0f;

    // Repeat messages inside this window are suppressed
    int64_t dedup_window_sec = 120;

    // Most recent alerts kept in the log
    size_t log_capacity = 10;
};

/**
 * Evaluate every rule against one sample.
 */
std::vector<Alert> evaluate_alerts(
    const MetricSample& sample,
    const Baselines& baselines,
    int64_t session_elapsed_sec,
    absl::Time now,
    const AlertThresholds& thresholds = {}
);

/**
 * Bounded, deduplicated record of emitted alerts.
 */
class AlertLog {
public:
    explicit AlertLog(size_t capacity = 10, int64_t dedup_window_sec = 120);

    /**
     * Returns false if an alert with the same message was appended less
     * than dedup_window_sec of session time ago.
     */
    bool append(const Alert& alert);

    /**
     * Oldest first, at most `capacity` entries.
     */
    const std::deque<Alert>& entries() const { return entries_; }

    /**
     * Every alert accepted this session, including ones since evicted.
     */
    int64_t total_emitted() const { return total_emitted_; }

    /**
     * Messages of the newest `count` alerts, newest first.
     */
    std::vector<std::string> recent_messages(size_t count) const;

private:
    size_t capacity_;
    int64_t dedup_window_sec_;
    int64_t total_emitted_ = 0;
    std::deque<Alert> entries_;

    // Dedup must outlive eviction from the capped log
    std::map<std::string, int64_t> last_emitted_sec_;
};

} // namespace therapy_lens
