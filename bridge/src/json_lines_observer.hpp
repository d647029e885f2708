/**
 * json_lines_observer.hpp — Streams session events to the dashboard
 *
 * Turns engine callbacks into JSON Lines on a JsonEmitter. The dashboard
 * only ever reads; commands come back on a separate channel (stdin).
 */

#pragma once

#include <string>

#include "json_emitter.hpp"
#include "session_engine.hpp"

namespace therapy_lens {

std::string sample_to_json_line(const MetricSample& sample);
std::string alert_to_json_line(const Alert& alert);

class JsonLinesObserver : public SessionObserver {
public:
    JsonLinesObserver(JsonEmitter& emitter, std::string patient_id);

    void on_state_changed(SessionPhase phase, int64_t elapsed_sec) override;
    void on_sample(const MetricSample& sample) override;
    void on_alert(const Alert& alert) override;
    void on_report(const SessionReport& report, const AlertLog& alerts) override;

private:
    JsonEmitter& emitter_;
    std::string patient_id_;
};

} // namespace therapy_lens
