/**
 * session_state.cpp — Implementation
 */

#include "session_state.hpp"

#include <algorithm>
#include <utility>

#include <absl/strings/str_cat.h>

namespace therapy_lens {

namespace {

absl::Status rejected(const char* action, SessionPhase phase) {
    return absl::FailedPreconditionError(
        absl::StrCat("Cannot ", action, " a session that is ", session_phase_to_string(phase)));
}

} // namespace

const char* session_phase_to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::IDLE:   return "idle";
        case SessionPhase::ACTIVE: return "active";
        case SessionPhase::PAUSED: return "paused";
        case SessionPhase::ENDED:  return "ended";
        default:                   return "idle";
    }
}

SessionState::SessionState(const Clock& clock, const AlertThresholds& thresholds)
    : clock_(clock)
    , alerts_(thresholds.log_capacity, thresholds.dedup_window_sec)
{
}

absl::Status SessionState::start(bool consent, const Baselines& baselines) {
    if (phase_ != SessionPhase::IDLE) {
        return rejected("start", phase_);
    }
    if (!consent) {
        return absl::FailedPreconditionError("Cannot start a session without patient consent");
    }
    baselines_ = baselines;
    started_at_ms_ = clock_.now_ms();
    accumulated_paused_ms_ = 0;
    phase_ = SessionPhase::ACTIVE;
    return absl::OkStatus();
}

absl::Status SessionState::pause() {
    if (phase_ != SessionPhase::ACTIVE) {
        return rejected("pause", phase_);
    }
    paused_at_ms_ = clock_.now_ms();
    phase_ = SessionPhase::PAUSED;
    return absl::OkStatus();
}

absl::Status SessionState::resume() {
    if (phase_ != SessionPhase::PAUSED) {
        return rejected("resume", phase_);
    }
    accumulated_paused_ms_ += std::max<int64_t>(0, clock_.now_ms() - paused_at_ms_);
    phase_ = SessionPhase::ACTIVE;
    return absl::OkStatus();
}

absl::Status SessionState::toggle_pause() {
    if (phase_ == SessionPhase::ACTIVE) return pause();
    if (phase_ == SessionPhase::PAUSED) return resume();
    return rejected("pause or resume", phase_);
}

absl::Status SessionState::end() {
    if (phase_ != SessionPhase::ACTIVE && phase_ != SessionPhase::PAUSED) {
        return rejected("end", phase_);
    }
    const int64_t now = clock_.now_ms();
    if (phase_ == SessionPhase::PAUSED) {
        accumulated_paused_ms_ += std::max<int64_t>(0, now - paused_at_ms_);
    }
    ended_at_ms_ = now;
    phase_ = SessionPhase::ENDED;
    return absl::OkStatus();
}

int64_t SessionState::elapsed_ms() const {
    return elapsed_ms_at(clock_.now_ms());
}

int64_t SessionState::elapsed_ms_at(int64_t at_ms) const {
    int64_t reference = 0;
    switch (phase_) {
        case SessionPhase::IDLE:   return 0;
        case SessionPhase::ACTIVE: reference = at_ms; break;
        case SessionPhase::PAUSED: reference = paused_at_ms_;   break;
        case SessionPhase::ENDED:  reference = ended_at_ms_;    break;
    }
    return std::max<int64_t>(0, reference - started_at_ms_ - accumulated_paused_ms_);
}

absl::Status SessionState::record_sample(const MetricSample& sample) {
    if (phase_ != SessionPhase::ACTIVE) {
        return rejected("sample", phase_);
    }
    metrics_history_.push_back(sample);
    return absl::OkStatus();
}

absl::StatusOr<std::vector<Alert>> SessionState::record_alerts(const std::vector<Alert>& candidates) {
    if (phase_ != SessionPhase::ACTIVE) {
        return rejected("raise alerts in", phase_);
    }
    std::vector<Alert> accepted;
    for (const auto& alert : candidates) {
        if (alerts_.append(alert)) {
            accepted.push_back(alert);
        }
    }
    return accepted;
}

absl::Status SessionState::set_report(SessionReport report) {
    if (phase_ != SessionPhase::ENDED) {
        return rejected("attach a report to", phase_);
    }
    if (report_.has_value()) {
        return absl::AlreadyExistsError("Session report was already produced");
    }
    report_ = std::move(report);
    return absl::OkStatus();
}

} // namespace therapy_lens
