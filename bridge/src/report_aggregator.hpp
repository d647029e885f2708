/**
 * report_aggregator.hpp — End-of-session statistics, insights and timeline
 *
 * Reduces the sampled history to per-metric descriptive statistics,
 * rule-based insight text (compared against baselines and fixed clinical
 * thresholds), and a coarse timeline of fixed-length segments, each
 * classified as Stable / Mild variation / Notable markers.
 *
 * An empty history yields zeroed statistics and a single "no data"
 * timeline entry.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <absl/strings/string_view.h>

#include "metric_sample.hpp"

namespace therapy_lens {

struct MetricStatistics {
    double  min     = 0.0;
    double  max     = 0.0;
    double  avg     = 0.0;
    double  std_dev = 0.0;   // population
    int64_t count   = 0;
};

enum class SegmentStatus {
    STABLE,
    MILD_VARIATION,
    NOTABLE_MARKERS,
    NO_DATA
};

const char* segment_status_to_string(SegmentStatus status);
std::optional<SegmentStatus> segment_status_from_string(absl::string_view text);

struct TimelineSegment {
    int64_t start_minute = 0;
    int64_t end_minute   = 0;
    int64_t sample_count = 0;

    double avg_eye_contact    = 0.0;
    double avg_gaze_stability = 0.0;
    double avg_breathing      = 0.0;

    SegmentStatus status = SegmentStatus::NO_DATA;
    std::string note;
};

struct SessionInsights {
    std::string eye_contact;
    std::string gaze_stability;
    std::string breathing;
    std::string emotion;
};

struct SessionReport {
    int64_t duration_sec = 0;

    MetricStatistics eye_contact;
    MetricStatistics gaze_stability;
    MetricStatistics breathing;

    SessionInsights insights;
    std::vector<TimelineSegment> timeline;

    int64_t alert_count = 0;

    std::string dominant_emotion = "neutral";
    std::map<std::string, int64_t> emotion_counts;

    // Text from the insight generator, or its fallback
    std::string narrative;
};

/**
 * Thresholds used for insight text and timeline classification.
 */
struct ReportConfig {
    // Timeline granularity
    int64_t segment_sec = 300;

    // Breathing average above baseline * this reads as sustained stress
    double elevated_breathing_factor = 1.3;
    // Segment breathing above baseline * this is mild variation
    double mild_breathing_factor = 1.15;
    double hyperventilation_bpm = 25.0;
    double breathing_variability_std = 4.0;

    double minimal_eye_contact_pct = 20.0;
    // Segment eye contact below baseline * this is mild variation
    double mild_eye_contact_factor = 0.75;
    double eye_contact_variability_std = 20.0;

    double anxiety_gaze_pct = 30.0;
    double dissociation_gaze_pct = 95.0;
    double gaze_variability_std = 20.0;
};

MetricStatistics compute_statistics(const std::vector<double>& values);

/**
 * Build the report. `narrative` is left empty for the caller to fill.
 */
SessionReport aggregate_report(
    const std::vector<MetricSample>& history,
    int64_t duration_sec,
    int64_t alert_count,
    const Baselines& baselines,
    const ReportConfig& config = {}
);

} // namespace therapy_lens
