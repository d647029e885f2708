/**
 * session_engine.hpp — Wires extractors, sampler, alerts and lifecycle
 *
 * Two periodic activities share one logical thread:
 *   - extraction: on_frame(), driven by the landmark source, every frame
 *   - sampling:   a Scheduler task on the injected clock (default 3 s),
 *                 run by poll() whether or not frames are arriving
 *
 * Sampling never waits for a frame. When frames stall, each missed
 * period still produces one sample of the held extractor values, stamped
 * with its own due time, so history has no gaps.
 *
 * Extraction and sampling only happen while ACTIVE. Pausing or ending
 * first records the samples already due, then disarms the sampler.
 * Resuming re-arms it without touching the rolling windows, so gaze and
 * breathing estimates do not cold-start.
 *
 * The engine is not thread-safe. A host with several producer threads
 * must serialize every call (the bridge holds one mutex around it).
 *
 * UI layers observe through SessionObserver and never mutate the session.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <absl/status/status.h>

#include "alert_evaluator.hpp"
#include "clock.hpp"
#include "insight_generator.hpp"
#include "landmark_snapshot.hpp"
#include "metric_extractors.hpp"
#include "metric_sampler.hpp"
#include "report_aggregator.hpp"
#include "scheduler.hpp"
#include "session_state.hpp"

namespace therapy_lens {

class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_state_changed(SessionPhase phase, int64_t elapsed_sec) {}
    virtual void on_sample(const MetricSample& sample) {}
    virtual void on_alert(const Alert& alert) {}
    virtual void on_report(const SessionReport& report, const AlertLog& alerts) {}
};

struct SessionConfig {
    int64_t sample_cadence_ms = 3000;
    ExtractorConfig extractors;
    AlertThresholds alerts;
    ReportConfig report;
};

class SessionEngine {
public:
    static constexpr char kSampleTask[] = "metric_sampler";

    /**
     * `insight_generator` may be null, in which case the report narrative
     * is the fallback text. Both it and `clock` must outlive the engine.
     */
    SessionEngine(const Clock& clock,
                  SessionConfig config = {},
                  InsightGenerator* insight_generator = nullptr);

    SessionEngine(const SessionEngine&) = delete;
    SessionEngine& operator=(const SessionEngine&) = delete;

    /**
     * Observers are not owned and must outlive the engine.
     */
    void add_observer(SessionObserver* observer);

    // ── Lifecycle ────────────────────────────────────────
    absl::Status start(bool consent, const Baselines& baselines);
    absl::Status pause();
    absl::Status resume();
    absl::Status toggle_pause();

    /**
     * End the session and produce its report exactly once.
     */
    absl::Status end();

    // ── Frame loop ───────────────────────────────────────

    /**
     * Feed one frame's worth of landmarks (nullopt = no face). Samples due
     * before the frame's instant are taken first, from the held values.
     */
    void on_frame(const std::optional<LandmarkSnapshot>& snapshot);

    /**
     * Run all sampling due by now. The host calls this on its own cadence
     * so that sampling does not depend on the frame rate.
     */
    void poll();

    const SessionState& session() const { return session_; }
    const MetricExtractors& extractors() const { return extractors_; }

private:
    void sample_tick(int64_t due_ms);
    void finalize_report();
    void notify_state();

    const Clock& clock_;
    SessionConfig config_;
    InsightGenerator* insight_generator_;

    MetricExtractors extractors_;
    SessionState session_;
    MetricSampler sampler_;
    Scheduler scheduler_;

    std::vector<SessionObserver*> observers_;
};

} // namespace therapy_lens
