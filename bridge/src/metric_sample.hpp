/**
 * metric_sample.hpp — One row of session history, and therapist baselines
 */

#pragma once

#include <cstdint>
#include <string>

namespace therapy_lens {

/**
 * Therapist-supplied reference values. Fixed once the session starts.
 */
struct Baselines {
    float baseline_breathing_bpm   = 14.0f;
    float baseline_eye_contact_pct = 65.0f;
};

struct MetricSample {
    int64_t session_elapsed_sec = 0;

    float eye_contact_pct    = 0.0f;   // [0, 100]
    float gaze_stability_pct = 0.0f;   // [0, 100]
    float breathing_bpm      = 0.0f;   // [8, 30]

    std::string dominant_emotion = "neutral";
    float emotion_confidence     = 0.0f;
};

} // namespace therapy_lens
