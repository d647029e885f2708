/**
 * metric_sampler.cpp — Implementation
 */

#include "metric_sampler.hpp"

#include <algorithm>
#include <utility>

#include <absl/time/time.h>
#include <glog/logging.h>

namespace therapy_lens {

MetricSampler::MetricSampler(const MetricExtractors& extractors,
                             SessionState& session,
                             const Clock& clock,
                             AlertThresholds thresholds)
    : extractors_(extractors)
    , session_(session)
    , clock_(clock)
    , thresholds_(thresholds)
{
}

absl::StatusOr<SampleOutcome> MetricSampler::tick(int64_t due_ms) {
    const int64_t lateness_ms = std::max<int64_t>(0, clock_.now_ms() - due_ms);
    const absl::Time stamped_at = clock_.wall_now() - absl::Milliseconds(lateness_ms);

    SampleOutcome outcome;
    MetricSample& sample = outcome.sample;
    sample.session_elapsed_sec = session_.elapsed_ms_at(due_ms) / 1000;
    sample.eye_contact_pct     = extractors_.eye_contact_pct();
    sample.gaze_stability_pct  = extractors_.gaze_stability_pct();
    sample.breathing_bpm       = extractors_.breathing_bpm();
    sample.dominant_emotion    = extractors_.emotion().dominant_emotion();
    sample.emotion_confidence  = extractors_.emotion().confidence();

    if (auto status = session_.record_sample(sample); !status.ok()) {
        return status;
    }

    VLOG(1) << "sample t=" << sample.session_elapsed_sec << "s"
            << " eye=" << sample.eye_contact_pct
            << " gaze=" << sample.gaze_stability_pct
            << " breathing=" << sample.breathing_bpm
            << " emotion=" << sample.dominant_emotion;

    auto candidates = evaluate_alerts(sample, session_.baselines(),
                                      sample.session_elapsed_sec, stamped_at, thresholds_);
    auto accepted = session_.record_alerts(candidates);
    if (!accepted.ok()) {
        return accepted.status();
    }
    outcome.alerts = std::move(*accepted);

    for (const auto& alert : outcome.alerts) {
        LOG(WARNING) << "[" << alert_severity_to_string(alert.severity) << "] minute "
                     << alert.minute << ": " << alert.message;
    }
    return outcome;
}

} // namespace therapy_lens
