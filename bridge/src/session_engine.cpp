/**
 * session_engine.cpp — Implementation
 */

#include "session_engine.hpp"

#include <utility>

#include <glog/logging.h>

namespace therapy_lens {

SessionEngine::SessionEngine(const Clock& clock,
                             SessionConfig config,
                             InsightGenerator* insight_generator)
    : clock_(clock)
    , config_(std::move(config))
    , insight_generator_(insight_generator)
    , extractors_(config_.extractors)
    , session_(clock, config_.alerts)
    , sampler_(extractors_, session_, clock, config_.alerts)
    , scheduler_(clock)
{
    if (config_.sample_cadence_ms <= 0) {
        LOG(WARNING) << "Invalid sample cadence " << config_.sample_cadence_ms
                     << " ms, using 3000 ms";
        config_.sample_cadence_ms = 3000;
    }
    auto status = scheduler_.add_periodic(kSampleTask, config_.sample_cadence_ms,
                                          [this](int64_t due_ms) { sample_tick(due_ms); });
    if (!status.ok()) {
        LOG(ERROR) << "Sampler not registered: " << status.message();
    }
}

void SessionEngine::add_observer(SessionObserver* observer) {
    if (observer != nullptr) {
        observers_.push_back(observer);
    }
}

absl::Status SessionEngine::start(bool consent, const Baselines& baselines) {
    if (auto status = session_.start(consent, baselines); !status.ok()) {
        return status;
    }
    // Unmeasured eye contact reads as the baseline, never as zero
    extractors_.seed_eye_contact(baselines.baseline_eye_contact_pct);
    if (auto status = scheduler_.arm(kSampleTask); !status.ok()) {
        return status;
    }
    LOG(INFO) << "Session started (baseline breathing " << baselines.baseline_breathing_bpm
              << " bpm, eye contact " << baselines.baseline_eye_contact_pct << "%)";
    notify_state();
    return absl::OkStatus();
}

absl::Status SessionEngine::pause() {
    if (session_.is_active()) {
        poll();
    }
    if (auto status = session_.pause(); !status.ok()) {
        return status;
    }
    if (auto status = scheduler_.disarm(kSampleTask); !status.ok()) {
        return status;
    }
    LOG(INFO) << "Session paused at " << session_.elapsed_sec() << "s";
    notify_state();
    return absl::OkStatus();
}

absl::Status SessionEngine::resume() {
    if (auto status = session_.resume(); !status.ok()) {
        return status;
    }
    if (auto status = scheduler_.arm(kSampleTask); !status.ok()) {
        return status;
    }
    LOG(INFO) << "Session resumed at " << session_.elapsed_sec() << "s";
    notify_state();
    return absl::OkStatus();
}

absl::Status SessionEngine::toggle_pause() {
    if (session_.phase() == SessionPhase::ACTIVE) return pause();
    return resume();
}

absl::Status SessionEngine::end() {
    if (session_.is_active()) {
        poll();
    }
    if (auto status = session_.end(); !status.ok()) {
        return status;
    }
    if (auto status = scheduler_.disarm(kSampleTask); !status.ok()) {
        return status;
    }
    LOG(INFO) << "Session ended after " << session_.elapsed_sec() << "s with "
              << session_.metrics_history().size() << " samples";
    notify_state();
    finalize_report();
    return absl::OkStatus();
}

void SessionEngine::on_frame(const std::optional<LandmarkSnapshot>& snapshot) {
    // A gap before this frame is sampled from what the extractors held
    scheduler_.poll_until(clock_.now_ms() - 1);
    if (session_.is_active() && snapshot.has_value()) {
        extractors_.update(*snapshot);
    }
    poll();
}

void SessionEngine::poll() {
    scheduler_.poll();
}

void SessionEngine::sample_tick(int64_t due_ms) {
    auto outcome = sampler_.tick(due_ms);
    if (!outcome.ok()) {
        LOG(WARNING) << "Sample skipped: " << outcome.status().message();
        return;
    }
    for (SessionObserver* observer : observers_) {
        observer->on_sample(outcome->sample);
        for (const auto& alert : outcome->alerts) {
            observer->on_alert(alert);
        }
    }
}

void SessionEngine::finalize_report() {
    SessionReport report = aggregate_report(
        session_.metrics_history(),
        session_.elapsed_sec(),
        session_.alerts().total_emitted(),
        session_.baselines(),
        config_.report
    );

    report.narrative = kInsightFallback;
    if (insight_generator_ != nullptr) {
        auto narrative = insight_generator_->generate(
            make_insight_request(report, session_.baselines(), session_.alerts()));
        if (narrative.ok()) {
            report.narrative = std::move(*narrative);
        } else {
            LOG(WARNING) << "Insight generation failed, using fallback: "
                         << narrative.status().message();
        }
    }

    if (auto status = session_.set_report(std::move(report)); !status.ok()) {
        LOG(ERROR) << "Report not stored: " << status.message();
        return;
    }
    LOG(INFO) << "Session report produced (" << session_.report()->timeline.size()
              << " timeline segments, " << session_.report()->alert_count << " alerts)";

    for (SessionObserver* observer : observers_) {
        observer->on_report(*session_.report(), session_.alerts());
    }
}

void SessionEngine::notify_state() {
    for (SessionObserver* observer : observers_) {
        observer->on_state_changed(session_.phase(), session_.elapsed_sec());
    }
}

} // namespace therapy_lens
