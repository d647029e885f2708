/**
 * metric_sampler.hpp — Periodic snapshot of extractor state into history
 *
 * The sampler does not wait for fresh frames. Each tick records whatever
 * the extractors currently hold, stamps it with session-elapsed time, and
 * runs the alert rules on the same values.
 */

#pragma once

#include <vector>

#include <absl/status/statusor.h>

#include "alert_evaluator.hpp"
#include "clock.hpp"
#include "metric_extractors.hpp"
#include "metric_sample.hpp"
#include "session_state.hpp"

namespace therapy_lens {

struct SampleOutcome {
    MetricSample sample;
    std::vector<Alert> alerts;   // only those that passed dedup
};

class MetricSampler {
public:
    MetricSampler(const MetricExtractors& extractors,
                  SessionState& session,
                  const Clock& clock,
                  AlertThresholds thresholds = {});

    /**
     * Record one sample for the instant `due_ms` on the session clock.
     * A tick that runs late is stamped with the elapsed time and wall time
     * of `due_ms`. Fails with FailedPrecondition unless the session is ACTIVE.
     */
    absl::StatusOr<SampleOutcome> tick(int64_t due_ms);

private:
    const MetricExtractors& extractors_;
    SessionState& session_;
    const Clock& clock_;
    AlertThresholds thresholds_;
};

} // namespace therapy_lens
