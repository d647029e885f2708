/**
 * report_aggregator.cpp — Implementation
 *
 * Segment classification, per segment:
 *   NOTABLE_MARKERS — any average past a clinical threshold
 *                     (breathing > baseline * 1.3 or > 25, eye contact < 20,
 *                      gaze < 30 or > 95)
 *   MILD_VARIATION  — any softer deviation (breathing > baseline * 1.15,
 *                     eye contact < baseline * 0.75, any SD past its limit)
 *   STABLE          — otherwise
 */

#include "report_aggregator.hpp"

#include <algorithm>
#include <cmath>

#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace therapy_lens {

namespace {

constexpr char kNoData[] = "No data collected";

std::string breathing_insight(const MetricStatistics& s, double baseline, const ReportConfig& cfg) {
    std::string text;
    if (s.avg > baseline * cfg.elevated_breathing_factor) {
        text = absl::StrFormat(
            "Breathing averaged %.1f bpm, well above the %.1f bpm baseline, "
            "suggesting elevated, sustained stress.", s.avg, baseline);
    } else if (s.avg < baseline * 0.8) {
        text = absl::StrFormat(
            "Breathing averaged %.1f bpm, below the %.1f bpm baseline, "
            "consistent with a calm state.", s.avg, baseline);
    } else {
        text = absl::StrFormat(
            "Breathing averaged %.1f bpm, within the normal range of the %.1f bpm baseline.",
            s.avg, baseline);
    }
    if (s.std_dev > cfg.breathing_variability_std) {
        text += absl::StrFormat(
            " Rate was highly variable (SD %.1f bpm), indicating fluctuating arousal.", s.std_dev);
    }
    return text;
}

std::string eye_contact_insight(const MetricStatistics& s, double baseline, const ReportConfig& cfg) {
    std::string text;
    if (s.avg < cfg.minimal_eye_contact_pct) {
        text = absl::StrFormat(
            "Eye contact averaged %.0f%%, minimal throughout; may indicate avoidance or discomfort.",
            s.avg);
    } else if (s.avg < baseline * 0.6) {
        text = absl::StrFormat(
            "Eye contact averaged %.0f%%, markedly below the %.0f%% baseline.", s.avg, baseline);
    } else if (s.avg < baseline) {
        text = absl::StrFormat(
            "Eye contact averaged %.0f%%, slightly below the %.0f%% baseline.", s.avg, baseline);
    } else {
        text = absl::StrFormat(
            "Eye contact averaged %.0f%%, at or above the %.0f%% baseline, "
            "suggesting good engagement.", s.avg, baseline);
    }
    if (s.std_dev > cfg.eye_contact_variability_std) {
        text += absl::StrFormat(" Engagement was highly variable (SD %.0f%%).", s.std_dev);
    }
    return text;
}

std::string gaze_insight(const MetricStatistics& s, const ReportConfig& cfg) {
    std::string text;
    if (s.avg < cfg.anxiety_gaze_pct) {
        text = absl::StrFormat(
            "Gaze stability averaged %.0f%%; frequent rapid eye movement suggests "
            "heightened anxiety.", s.avg);
    } else if (s.avg > cfg.dissociation_gaze_pct) {
        text = absl::StrFormat(
            "Gaze stability averaged %.0f%%; an unusually fixed gaze may warrant "
            "checking for dissociation.", s.avg);
    } else {
        text = absl::StrFormat("Gaze stability averaged %.0f%%, within a typical range.", s.avg);
    }
    if (s.std_dev > cfg.gaze_variability_std) {
        text += absl::StrFormat(" Gaze was highly variable (SD %.0f%%).", s.std_dev);
    }
    return text;
}

TimelineSegment classify_segment(
    int64_t index,
    const std::vector<const MetricSample*>& samples,
    const Baselines& baselines,
    const ReportConfig& cfg
) {
    std::vector<double> eye, gaze, breath;
    for (const MetricSample* s : samples) {
        eye.push_back(s->eye_contact_pct);
        gaze.push_back(s->gaze_stability_pct);
        breath.push_back(s->breathing_bpm);
    }
    const MetricStatistics eye_stats = compute_statistics(eye);
    const MetricStatistics gaze_stats = compute_statistics(gaze);
    const MetricStatistics breath_stats = compute_statistics(breath);

    TimelineSegment segment;
    segment.start_minute = index * cfg.segment_sec / 60;
    segment.end_minute = (index + 1) * cfg.segment_sec / 60;
    segment.sample_count = static_cast<int64_t>(samples.size());
    segment.avg_eye_contact = eye_stats.avg;
    segment.avg_gaze_stability = gaze_stats.avg;
    segment.avg_breathing = breath_stats.avg;

    const double breathing_baseline = baselines.baseline_breathing_bpm;
    const double eye_baseline = baselines.baseline_eye_contact_pct;

    std::vector<std::string> notable;
    if (breath_stats.avg > cfg.hyperventilation_bpm ||
        breath_stats.avg > breathing_baseline * cfg.elevated_breathing_factor) {
        notable.push_back("elevated breathing");
    }
    if (eye_stats.avg < cfg.minimal_eye_contact_pct) {
        notable.push_back("minimal eye contact");
    }
    if (gaze_stats.avg < cfg.anxiety_gaze_pct) {
        notable.push_back("rapid eye movement");
    }
    if (gaze_stats.avg > cfg.dissociation_gaze_pct) {
        notable.push_back("fixed gaze");
    }

    std::vector<std::string> mild;
    if (breath_stats.avg > breathing_baseline * cfg.mild_breathing_factor) {
        mild.push_back("breathing above baseline");
    }
    if (eye_stats.avg < eye_baseline * cfg.mild_eye_contact_factor) {
        mild.push_back("eye contact below baseline");
    }
    if (breath_stats.std_dev > cfg.breathing_variability_std) {
        mild.push_back("variable breathing");
    }
    if (eye_stats.std_dev > cfg.eye_contact_variability_std) {
        mild.push_back("variable eye contact");
    }
    if (gaze_stats.std_dev > cfg.gaze_variability_std) {
        mild.push_back("variable gaze");
    }

    if (!notable.empty()) {
        segment.status = SegmentStatus::NOTABLE_MARKERS;
        segment.note = absl::StrJoin(notable, "; ");
    } else if (!mild.empty()) {
        segment.status = SegmentStatus::MILD_VARIATION;
        segment.note = absl::StrJoin(mild, "; ");
    } else {
        segment.status = SegmentStatus::STABLE;
        segment.note = "All indicators within expected ranges";
    }
    return segment;
}

} // namespace

const char* segment_status_to_string(SegmentStatus status) {
    switch (status) {
        case SegmentStatus::STABLE:          return "stable";
        case SegmentStatus::MILD_VARIATION:  return "mild_variation";
        case SegmentStatus::NOTABLE_MARKERS: return "notable_markers";
        case SegmentStatus::NO_DATA:         return "no_data";
        default:                             return "no_data";
    }
}

std::optional<SegmentStatus> segment_status_from_string(absl::string_view text) {
    if (text == "stable")          return SegmentStatus::STABLE;
    if (text == "mild_variation")  return SegmentStatus::MILD_VARIATION;
    if (text == "notable_markers") return SegmentStatus::NOTABLE_MARKERS;
    if (text == "no_data")         return SegmentStatus::NO_DATA;
    return std::nullopt;
}

MetricStatistics compute_statistics(const std::vector<double>& values) {
    MetricStatistics stats;
    if (values.empty()) {
        return stats;
    }

    stats.count = static_cast<int64_t>(values.size());
    stats.min = *std::min_element(values.begin(), values.end());
    stats.max = *std::max_element(values.begin(), values.end());

    double sum = 0.0;
    for (double v : values) sum += v;
    stats.avg = sum / static_cast<double>(values.size());

    double sq = 0.0;
    for (double v : values) sq += (v - stats.avg) * (v - stats.avg);
    stats.std_dev = std::sqrt(sq / static_cast<double>(values.size()));
    return stats;
}

SessionReport aggregate_report(
    const std::vector<MetricSample>& history,
    int64_t duration_sec,
    int64_t alert_count,
    const Baselines& baselines,
    const ReportConfig& config
) {
    SessionReport report;
    report.duration_sec = duration_sec;
    report.alert_count = alert_count;

    if (history.empty()) {
        report.insights.eye_contact = kNoData;
        report.insights.gaze_stability = kNoData;
        report.insights.breathing = kNoData;
        report.insights.emotion = kNoData;

        TimelineSegment empty;
        empty.end_minute = duration_sec / 60;
        empty.status = SegmentStatus::NO_DATA;
        empty.note = kNoData;
        report.timeline.push_back(empty);
        return report;
    }

    // ── Statistics ───────────────────────────────────────
    std::vector<double> eye, gaze, breath;
    eye.reserve(history.size());
    gaze.reserve(history.size());
    breath.reserve(history.size());
    for (const auto& sample : history) {
        eye.push_back(sample.eye_contact_pct);
        gaze.push_back(sample.gaze_stability_pct);
        breath.push_back(sample.breathing_bpm);
        report.emotion_counts[sample.dominant_emotion] += 1;
    }
    report.eye_contact = compute_statistics(eye);
    report.gaze_stability = compute_statistics(gaze);
    report.breathing = compute_statistics(breath);

    int64_t best = 0;
    for (const auto& [label, count] : report.emotion_counts) {
        if (count > best) {
            best = count;
            report.dominant_emotion = label;
        }
    }

    // ── Insights ─────────────────────────────────────────
    report.insights.breathing =
        breathing_insight(report.breathing, baselines.baseline_breathing_bpm, config);
    report.insights.eye_contact =
        eye_contact_insight(report.eye_contact, baselines.baseline_eye_contact_pct, config);
    report.insights.gaze_stability = gaze_insight(report.gaze_stability, config);
    report.insights.emotion = absl::StrFormat(
        "Predominant expression: %s (%d of %d samples).",
        report.dominant_emotion, best, static_cast<int64_t>(history.size()));

    // ── Timeline ─────────────────────────────────────────
    const int64_t segment_sec = std::max<int64_t>(1, config.segment_sec);
    std::map<int64_t, std::vector<const MetricSample*>> segments;
    for (const auto& sample : history) {
        segments[std::max<int64_t>(0, sample.session_elapsed_sec) / segment_sec].push_back(&sample);
    }
    ReportConfig effective = config;
    effective.segment_sec = segment_sec;
    for (const auto& [index, samples] : segments) {
        report.timeline.push_back(classify_segment(index, samples, baselines, effective));
    }

    return report;
}

} // namespace therapy_lens
