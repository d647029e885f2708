/**
 * metric_extractors.cpp — Implementation
 *
 * Pixel-space formulas:
 *   eye contact  = 100 - slope * (|x/W - 0.5| + |y/H - 0.5|) * 100
 *   gaze         = 100 - slope * mean distance from the window centroid
 *   breathing    = peaks / window seconds * 60, clamped, then averaged
 *                  with the previous estimate
 */

#include "metric_extractors.hpp"

#include <algorithm>
#include <cmath>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>
#include <glog/logging.h>

namespace therapy_lens {

absl::Status validate_extractor_config(const ExtractorConfig& config) {
    if (config.gaze_window_ms <= 0 || config.breathing_window_ms <= 0) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Windows must be positive (gaze %d ms, breathing %d ms)",
            config.gaze_window_ms, config.breathing_window_ms));
    }
    if (config.gaze_min_samples < 1 || config.breathing_min_samples < 1) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Minimum sample counts must be at least 1 (gaze %d, breathing %d)",
            config.gaze_min_samples, config.breathing_min_samples));
    }
    if (config.peak_refractory < 0) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Peak refractory gap must not be negative, got %d", config.peak_refractory));
    }
    if (!(config.breathing_min_bpm <= config.breathing_max_bpm)) {
        return absl::InvalidArgumentError(absl::StrFormat(
            "Breathing clamp [%.1f, %.1f] is empty",
            config.breathing_min_bpm, config.breathing_max_bpm));
    }
    return absl::OkStatus();
}

// ── Eye contact ──────────────────────────────────────────

EyeContactExtractor::EyeContactExtractor(const ExtractorConfig& config)
    : slope_(config.eye_contact_slope)
    , value_(std::clamp(config.eye_contact_initial_pct, 0.0f, 100.0f))
{
}

void EyeContactExtractor::seed(float pct) {
    if (measured_ || !std::isfinite(pct)) {
        return;
    }
    value_ = std::clamp(pct, 0.0f, 100.0f);
}

float EyeContactExtractor::update(const LandmarkSnapshot& snapshot) {
    const Point2* nose = snapshot.find_point(landmarks::kNoseTip);
    if (nose == nullptr || snapshot.frame_width <= 0 || snapshot.frame_height <= 0) {
        return value_;
    }

    const float dev_x = std::fabs(nose->x / snapshot.frame_width - 0.5f) * 100.0f;
    const float dev_y = std::fabs(nose->y / snapshot.frame_height - 0.5f) * 100.0f;
    const float pct = 100.0f - (dev_x + dev_y) * slope_;
    if (!std::isfinite(pct)) {
        return value_;
    }

    value_ = std::round(std::clamp(pct, 0.0f, 100.0f));
    measured_ = true;
    return value_;
}

// ── Gaze stability ───────────────────────────────────────

GazeStabilityExtractor::GazeStabilityExtractor(const ExtractorConfig& config)
    : min_samples_(config.gaze_min_samples)
    , default_pct_(config.gaze_default_pct)
    , slope_(config.gaze_slope)
    , value_(config.gaze_default_pct)
    , window_(config.gaze_window_ms)
{
}

float GazeStabilityExtractor::update(const LandmarkSnapshot& snapshot) {
    const Point2* nose = snapshot.find_point(landmarks::kNoseTip);
    if (nose == nullptr || !std::isfinite(nose->x) || !std::isfinite(nose->y)) {
        return value_;
    }

    window_.push(snapshot.captured_at_ms, *nose);

    // Too little history reads as instability; report the default instead
    if (window_.size() < static_cast<size_t>(min_samples_)) {
        value_ = default_pct_;
        return value_;
    }

    double cx = 0.0, cy = 0.0;
    for (const auto& entry : window_.entries()) {
        cx += entry.value.x;
        cy += entry.value.y;
    }
    const double n = static_cast<double>(window_.size());
    cx /= n;
    cy /= n;

    double spread = 0.0;
    for (const auto& entry : window_.entries()) {
        const double dx = entry.value.x - cx;
        const double dy = entry.value.y - cy;
        spread += std::sqrt(dx * dx + dy * dy);
    }
    spread /= n;

    const double pct = 100.0 - spread * slope_;
    value_ = static_cast<float>(std::round(std::clamp(pct, 0.0, 100.0)));
    VLOG(2) << "gaze spread=" << spread << "px stability=" << value_;
    return value_;
}

// ── Breathing ────────────────────────────────────────────

BreathingExtractor::BreathingExtractor(const ExtractorConfig& config)
    : config_(config)
    , value_(std::clamp(config.breathing_initial_bpm,
                        config.breathing_min_bpm, config.breathing_max_bpm))
    , window_(config.breathing_window_ms)
{
}

int BreathingExtractor::count_peaks(const std::vector<float>& series, float epsilon, int refractory) {
    if (series.size() < 3) {
        return 0;
    }

    double mean = 0.0;
    for (float v : series) mean += v;
    mean /= static_cast<double>(series.size());
    const double threshold = mean * (1.0 + epsilon);

    int peaks = 0;
    for (size_t i = 1; i + 1 < series.size(); ++i) {
        if (series[i] > series[i - 1] && series[i] > series[i + 1] && series[i] > threshold) {
            ++peaks;
            i += static_cast<size_t>(std::max(0, refractory));
        }
    }
    return peaks;
}

float BreathingExtractor::update(const LandmarkSnapshot& snapshot) {
    const Point2* nose = snapshot.find_point(landmarks::kNoseTip);
    const Point2* upper_lip = snapshot.find_point(landmarks::kUpperLip);
    if (nose == nullptr || upper_lip == nullptr) {
        return value_;
    }

    const float separation = std::fabs(upper_lip->y - nose->y);
    if (!std::isfinite(separation)) {
        return value_;
    }
    window_.push(snapshot.captured_at_ms, separation);

    if (window_.size() < static_cast<size_t>(config_.breathing_min_samples)) {
        return value_;
    }

    const double duration_s = window_.span_ms() / 1000.0;
    if (duration_s <= 0.0) {
        return value_;
    }

    std::vector<float> series;
    series.reserve(window_.size());
    for (const auto& entry : window_.entries()) {
        series.push_back(entry.value);
    }

    const int peaks = count_peaks(series, config_.peak_epsilon, config_.peak_refractory);
    const double raw = std::clamp(peaks / duration_s * 60.0,
                                  static_cast<double>(config_.breathing_min_bpm),
                                  static_cast<double>(config_.breathing_max_bpm));

    // One-step smoothing; both operands are in range so the result is too
    const double smoothed = (raw + value_) / 2.0;
    value_ = static_cast<float>(std::round(smoothed * 10.0) / 10.0);
    VLOG(2) << "breathing peaks=" << peaks << " over " << duration_s
            << "s raw=" << raw << " smoothed=" << value_;
    return value_;
}

// ── Emotion ──────────────────────────────────────────────

const std::vector<std::string>& known_emotion_labels() {
    static const std::vector<std::string> labels = {
        "neutral", "happy", "sad", "angry", "fearful", "disgusted", "surprised"
    };
    return labels;
}

EmotionDistribution normalize_expressions(const std::map<std::string, float>& raw) {
    std::map<std::string, float> lowered;
    for (const auto& [label, score] : raw) {
        lowered[absl::AsciiStrToLower(label)] = score;
    }

    EmotionDistribution out;
    double total = 0.0;
    for (const auto& label : known_emotion_labels()) {
        float v = 0.0f;
        auto it = lowered.find(label);
        if (it != lowered.end() && std::isfinite(it->second)) {
            v = std::clamp(it->second, 0.0f, 1.0f);
        }
        out.scores[label] = v;
        total += v;
    }

    if (total > 1.0) {
        for (auto& [label, v] : out.scores) {
            v = static_cast<float>(v / total);
        }
        total = 1.0;
    }
    out.scores["neutral"] += static_cast<float>(std::max(0.0, 1.0 - total));

    for (const auto& label : known_emotion_labels()) {
        const float v = out.scores[label];
        if (v > out.confidence) {
            out.dominant = label;
            out.confidence = v;
        }
    }
    return out;
}

void EmotionExtractor::update(const LandmarkSnapshot& snapshot) {
    if (!snapshot.expression_scores.has_value()) {
        distribution_.reset();
        return;
    }
    distribution_ = normalize_expressions(*snapshot.expression_scores);
}

std::string EmotionExtractor::dominant_emotion() const {
    return distribution_ ? distribution_->dominant : "neutral";
}

float EmotionExtractor::confidence() const {
    return distribution_ ? distribution_->confidence : 0.0f;
}

// ── Aggregate ────────────────────────────────────────────

MetricExtractors::MetricExtractors(const ExtractorConfig& config)
    : eye_contact_(config)
    , gaze_stability_(config)
    , breathing_(config)
{
}

void MetricExtractors::update(const LandmarkSnapshot& snapshot) {
    eye_contact_.update(snapshot);
    gaze_stability_.update(snapshot);
    breathing_.update(snapshot);
    emotion_.update(snapshot);
}

} // namespace therapy_lens
