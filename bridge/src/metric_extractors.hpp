/**
 * metric_extractors.hpp — Behavioral signals from landmark snapshots
 *
 * One extractor per metric, each holding its own last good value:
 *
 *   Eye contact %      — nose-tip offset from the image center
 *   Gaze stability %   — positional spread of the nose tip over ~2 s
 *   Breathing (bpm)    — peak count of nose/upper-lip separation over ~10 s
 *   Emotion            — normalized expression distribution + dominant label
 *
 * A snapshot missing a required landmark leaves the extractor unchanged.
 * Frames with no face at all are simply not passed in. Either way the
 * last good value is held indefinitely, never reset.
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/status.h>

#include "landmark_snapshot.hpp"
#include "rolling_window.hpp"

namespace therapy_lens {

/**
 * Extraction constants. The breathing values in particular are a
 * reasonable starting point, not a clinical calibration; all of them are
 * exposed as flags.
 */
struct ExtractorConfig {
    // Eye contact: percentage lost per point of combined center deviation
    float eye_contact_slope       = 2.5f;
    float eye_contact_initial_pct = 65.0f;   // reported until a face is measured

    // Gaze stability
    int64_t gaze_window_ms     = 2000;
    int     gaze_min_samples   = 10;
    float   gaze_default_pct   = 90.0f;   // reported until the window fills
    float   gaze_slope         = 4.0f;    // percentage lost per pixel of spread

    // Breathing
    int64_t breathing_window_ms   = 10000;
    int     breathing_min_samples = 50;
    float   peak_epsilon          = 0.01f;  // peak must exceed mean * (1 + eps)
    int     peak_refractory       = 3;      // samples skipped after a peak
    float   breathing_min_bpm     = 8.0f;
    float   breathing_max_bpm     = 30.0f;
    float   breathing_initial_bpm = 14.0f;
};

/**
 * InvalidArgument when a window, sample count or refractory gap is out of
 * range.
 */
absl::Status validate_extractor_config(const ExtractorConfig& config);

class EyeContactExtractor {
public:
    explicit EyeContactExtractor(const ExtractorConfig& config);

    float update(const LandmarkSnapshot& snapshot);
    float value() const { return value_; }

    /**
     * Replace the initial value, e.g. with the patient's baseline. Ignored
     * once a face has been measured.
     */
    void seed(float pct);
    bool has_measurement() const { return measured_; }

private:
    float slope_;
    float value_;
    bool measured_ = false;
};

class GazeStabilityExtractor {
public:
    explicit GazeStabilityExtractor(const ExtractorConfig& config);

    float update(const LandmarkSnapshot& snapshot);
    float value() const { return value_; }

    size_t window_size() const { return window_.size(); }

private:
    int min_samples_;
    float default_pct_;
    float slope_;
    float value_;
    RollingWindow<Point2> window_;
};

class BreathingExtractor {
public:
    explicit BreathingExtractor(const ExtractorConfig& config);

    float update(const LandmarkSnapshot& snapshot);
    float value() const { return value_; }

    size_t window_size() const { return window_.size(); }

    /**
     * Count local maxima above mean * (1 + epsilon), skipping `refractory`
     * samples after each one so a single breath is not counted twice.
     */
    static int count_peaks(const std::vector<float>& series, float epsilon, int refractory);

private:
    ExtractorConfig config_;
    float value_;
    RollingWindow<float> window_;
};

/**
 * Labels the emotion extractor knows, in tie-break order.
 */
const std::vector<std::string>& known_emotion_labels();

struct EmotionDistribution {
    std::map<std::string, float> scores;   // one entry per known label, sums to 1
    std::string dominant = "neutral";
    float confidence = 0.0f;
};

/**
 * Clamp to [0,1], drop unknown labels, scale down if the sum exceeds 1,
 * and give the remainder to "neutral".
 */
EmotionDistribution normalize_expressions(const std::map<std::string, float>& raw);

class EmotionExtractor {
public:
    void update(const LandmarkSnapshot& snapshot);

    /**
     * Empty when the last face snapshot carried no expression data.
     */
    const std::optional<EmotionDistribution>& distribution() const { return distribution_; }

    /**
     * "neutral" with zero confidence when there is no distribution.
     */
    std::string dominant_emotion() const;
    float confidence() const;

private:
    std::optional<EmotionDistribution> distribution_;
};

/**
 * The four extractors driven together from the frame loop.
 */
class MetricExtractors {
public:
    explicit MetricExtractors(const ExtractorConfig& config = {});

    void update(const LandmarkSnapshot& snapshot);

    // Starting eye contact for a new session, before any face is seen
    void seed_eye_contact(float pct) { eye_contact_.seed(pct); }

    float eye_contact_pct() const { return eye_contact_.value(); }
    float gaze_stability_pct() const { return gaze_stability_.value(); }
    float breathing_bpm() const { return breathing_.value(); }
    const EmotionExtractor& emotion() const { return emotion_; }

    const GazeStabilityExtractor& gaze_stability() const { return gaze_stability_; }
    const BreathingExtractor& breathing() const { return breathing_; }

private:
    EyeContactExtractor eye_contact_;
    GazeStabilityExtractor gaze_stability_;
    BreathingExtractor breathing_;
    EmotionExtractor emotion_;
};

} // namespace therapy_lens
