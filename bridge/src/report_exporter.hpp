/**
 * report_exporter.hpp — Flat JSON document for a finished session
 *
 * Layout:
 *   {
 *     "patient_id": "******1234",
 *     "duration_sec": 1200, "alert_count": 2, "dominant_emotion": "neutral",
 *     "narrative": "...",
 *     "statistics": { "eye_contact": {min,max,avg,std_dev,count}, ... },
 *     "insights":   { "eye_contact": "...", ... },
 *     "emotion_counts": { "neutral": 380, ... },
 *     "timeline": [ {start_minute,end_minute,sample_count,avg_*,status,note} ],
 *     "alerts":   [ {severity,message,minute,session_elapsed_sec,timestamp} ]
 *   }
 *
 * Doubles are written with 17 significant digits so statistics survive a
 * round trip exactly. Timestamps are RFC 3339 in UTC.
 */

#pragma once

#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "alert_evaluator.hpp"
#include "report_aggregator.hpp"

namespace therapy_lens {

struct ExportedReport {
    std::string patient_id;   // already anonymized
    SessionReport report;
    std::vector<Alert> alerts;
};

/**
 * Mask all but the last four characters with '*'.
 */
std::string anonymize_patient_id(absl::string_view patient_id);

/**
 * Serialize a report. `patient_id` is anonymized before it is written.
 */
std::string export_report_json(const SessionReport& report,
                               absl::string_view patient_id,
                               const std::vector<Alert>& alerts);

absl::StatusOr<ExportedReport> parse_report_json(absl::string_view text);

} // namespace therapy_lens
