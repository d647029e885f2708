/**
 * session_state.hpp — Session lifecycle and the data it owns
 *
 *   IDLE ──start(consent)──▶ ACTIVE ◀──toggle──▶ PAUSED
 *                              │                   │
 *                              └──────end──────────┴──▶ ENDED (terminal)
 *
 * Elapsed session time is (now - started) - accumulated pause time. It is
 * frozen while PAUSED and after ENDED. Calls that do not fit the current
 * state return FailedPrecondition and change nothing; they come from
 * caller-side races (a double-clicked button) and are never fatal.
 *
 * Metric history and the alert log only accept writes while ACTIVE. The
 * report is attached exactly once, after ENDED.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "alert_evaluator.hpp"
#include "clock.hpp"
#include "metric_sample.hpp"
#include "report_aggregator.hpp"

namespace therapy_lens {

enum class SessionPhase {
    IDLE,
    ACTIVE,
    PAUSED,
    ENDED
};

const char* session_phase_to_string(SessionPhase phase);

class SessionState {
public:
    SessionState(const Clock& clock, const AlertThresholds& thresholds = {});

    SessionState(const SessionState&) = delete;
    SessionState& operator=(const SessionState&) = delete;

    // ── Transitions ──────────────────────────────────────
    absl::Status start(bool consent, const Baselines& baselines);
    absl::Status pause();
    absl::Status resume();
    absl::Status toggle_pause();
    absl::Status end();

    // ── Clock ────────────────────────────────────────────
    int64_t elapsed_ms() const;
    int64_t elapsed_sec() const { return elapsed_ms() / 1000; }

    /**
     * Elapsed time as it stood at `at_ms`, for work that runs late but
     * belongs to an earlier instant. Only meaningful while ACTIVE and
     * for an `at_ms` after the last resume.
     */
    int64_t elapsed_ms_at(int64_t at_ms) const;

    // ── Data ─────────────────────────────────────────────
    absl::Status record_sample(const MetricSample& sample);

    /**
     * Offer freshly evaluated alerts to the log. Returns the ones that
     * survived deduplication.
     */
    absl::StatusOr<std::vector<Alert>> record_alerts(const std::vector<Alert>& candidates);

    /**
     * Attach the final report. Only valid once, after end().
     */
    absl::Status set_report(SessionReport report);

    SessionPhase phase() const { return phase_; }
    bool is_active() const { return phase_ == SessionPhase::ACTIVE; }
    const Baselines& baselines() const { return baselines_; }

    int64_t started_at_ms() const { return started_at_ms_; }
    int64_t accumulated_paused_ms() const { return accumulated_paused_ms_; }

    const std::vector<MetricSample>& metrics_history() const { return metrics_history_; }
    const AlertLog& alerts() const { return alerts_; }
    const std::optional<SessionReport>& report() const { return report_; }

private:
    const Clock& clock_;
    SessionPhase phase_ = SessionPhase::IDLE;
    Baselines baselines_;

    int64_t started_at_ms_         = 0;
    int64_t paused_at_ms_          = 0;
    int64_t ended_at_ms_           = 0;
    int64_t accumulated_paused_ms_ = 0;

    std::vector<MetricSample> metrics_history_;
    AlertLog alerts_;
    std::optional<SessionReport> report_;
};

} // namespace therapy_lens
