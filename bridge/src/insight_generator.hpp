/**
 * insight_generator.hpp — Narrative text from an external collaborator
 *
 * At session end the engine hands a numeric summary to a text generator
 * (typically a language-model wrapper) and embeds whatever string comes
 * back verbatim. A failing generator never blocks the report: the
 * narrative falls back to kInsightFallback.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "alert_evaluator.hpp"
#include "metric_sample.hpp"
#include "report_aggregator.hpp"

namespace therapy_lens {

inline constexpr char kInsightFallback[] = "AI analysis unavailable.";

struct InsightRequest {
    int64_t duration_sec = 0;
    double avg_eye_contact_pct    = 0.0;
    double avg_gaze_stability_pct = 0.0;
    double avg_breathing_bpm      = 0.0;
    Baselines baselines;
    std::string dominant_emotion = "neutral";
    std::vector<std::string> recent_alerts;   // newest first
};

InsightRequest make_insight_request(const SessionReport& report,
                                    const Baselines& baselines,
                                    const AlertLog& alerts,
                                    size_t max_alerts = 5);

std::string insight_request_to_json(const InsightRequest& request);

class InsightGenerator {
public:
    virtual ~InsightGenerator() = default;

    virtual absl::StatusOr<std::string> generate(const InsightRequest& request) = 0;
};

/**
 * Runs `<command> <request.json>` through /bin/sh and takes its stdout as
 * the narrative. A non-zero exit or empty output is an error. A command
 * still running at the deadline is killed along with anything it spawned,
 * and generate() returns DeadlineExceeded.
 */
class CommandInsightGenerator : public InsightGenerator {
public:
    static constexpr absl::Duration kDefaultTimeout = absl::Seconds(20);

    explicit CommandInsightGenerator(std::string command,
                                     absl::Duration timeout = kDefaultTimeout);

    absl::StatusOr<std::string> generate(const InsightRequest& request) override;

private:
    std::string command_;
    absl::Duration timeout_;
};

} // namespace therapy_lens
