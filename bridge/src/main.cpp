/**
 * main.cpp — TherapyLens Bridge
 *
 * Headless session runner with two landmark sources:
 *
 *   SMARTSPECTRA (default, --source=smartspectra):
 *     Runs the SmartSpectra SDK, either capturing the webcam directly
 *     (--mode=local) or reading frames a relay writes into a directory
 *     (--mode=server --file_stream_path=...).
 *
 *   REPLAY (--source=replay --replay_path=...):
 *     Feeds a recorded JSON Lines capture through the same engine on a
 *     virtual clock. Used for offline review and reproducible demos.
 *
 * Session events (state, sample, alert, report) go to stdout as JSON lines.
 * Control commands (start | pause | resume | toggle | end) are read from
 * stdin, one per line.
 *
 * Usage:
 *   # Live session, started from the dashboard
 *   ./therapy_lens_bridge --api_key=YOUR_KEY --consent
 *
 *   # Replay a capture and save the report
 *   ./therapy_lens_bridge --source=replay --replay_path=session.jsonl \
 *       --consent --auto_start --report_path=report.json
 *
 * The process runs until it receives SIGTERM/SIGINT, the parent process
 * closes stdin (live), or the capture is exhausted (replay). An unfinished
 * session is ended on the way out so the report is always produced.
 */

// ── Standard Library ─────────────────────────────────────
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// ── Third-party ──────────────────────────────────────────
#include <absl/cleanup/cleanup.h>
#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>
#include <absl/time/time.h>
#include <glog/logging.h>

// ── TherapyLens ──────────────────────────────────────────
#include "clock.hpp"
#include "command_queue.hpp"
#include "insight_generator.hpp"
#include "json_emitter.hpp"
#include "json_lines_observer.hpp"
#include "metric_extractors.hpp"
#include "replay_source.hpp"
#include "report_exporter.hpp"
#include "session_engine.hpp"
#include "smartspectra_source.hpp"

namespace tl = therapy_lens;

// ── Command-line Flags ───────────────────────────────────
ABSL_FLAG(std::string, source, "smartspectra",
    "Landmark source: 'smartspectra' (live SDK) or 'replay' (recorded JSON Lines).");
ABSL_FLAG(std::string, replay_path, "",
    "Capture file to replay. Replay source only.");

// -- SmartSpectra flags --
ABSL_FLAG(std::string, api_key, "",
    "Presage Physiology API key. Can also be set via SMARTSPECTRA_API_KEY env var.");
ABSL_FLAG(std::string, mode, "local",
    "SmartSpectra mode: 'local' (capture webcam directly) or 'server' (read frames from directory).");
ABSL_FLAG(int, camera_device_index, 0,
    "Index of the camera device to use (0 = default webcam). Local mode only.");
ABSL_FLAG(int, capture_width, 1280,
    "Capture width in pixels. Local mode only.");
ABSL_FLAG(int, capture_height, 720,
    "Capture height in pixels. Local mode only.");
ABSL_FLAG(std::string, file_stream_path, "",
    "Path pattern for frame files, e.g. '/tmp/therapy_frames/frame0000000000000000.png'. "
    "The zero padding defines digit count; the number encodes the timestamp in microseconds. "
    "Server mode only.");
ABSL_FLAG(int, rescan_delay_ms, 5,
    "Delay in ms before re-scanning the frame directory for new files. Server mode only.");
ABSL_FLAG(bool, erase_read_files, true,
    "Erase frame files after they've been read. Server mode only.");

// -- Session --
ABSL_FLAG(bool, consent, false,
    "Patient consent to recording has been obtained. A session cannot start without it.");
ABSL_FLAG(bool, auto_start, false,
    "Start the session immediately instead of waiting for a 'start' command.");
ABSL_FLAG(std::string, patient_id, "",
    "Patient identifier (anonymized in the report). Can also be set via THERAPY_LENS_PATIENT_ID.");
ABSL_FLAG(float, baseline_breathing_bpm, 14.0f,
    "Patient's resting breathing rate (breaths/min).");
ABSL_FLAG(float, baseline_eye_contact_pct, 65.0f,
    "Patient's typical eye contact (%).");
ABSL_FLAG(int64_t, sample_cadence_ms, 3000,
    "Interval between metric samples, in ms of session time.");
ABSL_FLAG(std::string, report_path, "",
    "Write the session report JSON here when the session ends.");
ABSL_FLAG(std::string, insight_command, "",
    "Program run as '<command> <request.json>' whose stdout becomes the report narrative.");
ABSL_FLAG(int64_t, insight_timeout_ms, 20000,
    "Kill the insight command after this long and use the fallback narrative.");

// -- Extraction constants --
ABSL_FLAG(float, eye_contact_slope, 2.5f,
    "Eye contact lost per point of combined center deviation.");
ABSL_FLAG(int64_t, gaze_window_ms, 2000,
    "Gaze stability rolling window (ms).");
ABSL_FLAG(int, gaze_min_samples, 10,
    "Samples needed before gaze stability leaves its default.");
ABSL_FLAG(float, gaze_slope, 4.0f,
    "Gaze stability lost per pixel of mean nose-tip spread.");
ABSL_FLAG(int64_t, breathing_window_ms, 10000,
    "Breathing rolling window (ms).");
ABSL_FLAG(int, breathing_min_samples, 50,
    "Samples needed before the breathing estimate updates.");
ABSL_FLAG(float, peak_epsilon, 0.01f,
    "A breathing peak must exceed the window mean by this fraction.");
ABSL_FLAG(int, peak_refractory, 3,
    "Samples skipped after each breathing peak.");

// -- Alert thresholds --
ABSL_FLAG(float, hyperventilation_bpm, 25.0f,
    "Breathing rate (breaths/min) that raises a critical alert.");
ABSL_FLAG(float, breathing_increase_factor, 1.5f,
    "Multiple of baseline breathing that raises a warning.");
ABSL_FLAG(float, minimal_eye_contact_pct, 20.0f,
    "Eye contact (%) below which a warning is raised after the warm-up.");
ABSL_FLAG(float, dissociation_gaze_pct, 95.0f,
    "Gaze stability (%) above which possible dissociation is flagged.");
ABSL_FLAG(float, anxiety_gaze_pct, 30.0f,
    "Gaze stability (%) below which heightened anxiety is flagged.");
ABSL_FLAG(int64_t, alert_dedup_sec, 120,
    "Identical alert messages inside this window (session seconds) are suppressed.");

// -- Report --
ABSL_FLAG(int64_t, segment_sec, 300,
    "Timeline segment length in session seconds.");

// ── Globals ──────────────────────────────────────────────
static tl::JsonEmitter g_emitter;
// Shared with the detached stdin reader, which keeps it alive during exit
static std::shared_ptr<tl::CommandQueue> g_commands = std::make_shared<tl::CommandQueue>();
static volatile std::sig_atomic_t g_shutdown_requested = 0;
static std::atomic<bool> g_stdin_closed{false};

// How often the live sampling thread checks for due samples and commands
constexpr int kSamplingPollMs = 100;

void signal_handler(int signal) {
    g_shutdown_requested = 1;
}

// ── Resolve secrets / identity ───────────────────────────
std::string flag_or_env(const std::string& flag_value, const char* env_name) {
    if (!flag_value.empty()) return flag_value;

    const char* env_value = std::getenv(env_name);
    if (env_value && env_value[0] != '\0') return std::string(env_value);

    return "";
}

// ── Configuration ────────────────────────────────────────
absl::StatusOr<tl::SessionConfig> session_config_from_flags() {
    tl::SessionConfig config;
    config.sample_cadence_ms = absl::GetFlag(FLAGS_sample_cadence_ms);

    config.extractors.eye_contact_slope     = absl::GetFlag(FLAGS_eye_contact_slope);
    config.extractors.gaze_window_ms        = absl::GetFlag(FLAGS_gaze_window_ms);
    config.extractors.gaze_min_samples      = absl::GetFlag(FLAGS_gaze_min_samples);
    config.extractors.gaze_slope            = absl::GetFlag(FLAGS_gaze_slope);
    config.extractors.breathing_window_ms   = absl::GetFlag(FLAGS_breathing_window_ms);
    config.extractors.breathing_min_samples = absl::GetFlag(FLAGS_breathing_min_samples);
    config.extractors.peak_epsilon          = absl::GetFlag(FLAGS_peak_epsilon);
    config.extractors.peak_refractory       = absl::GetFlag(FLAGS_peak_refractory);

    config.alerts.hyperventilation_bpm      = absl::GetFlag(FLAGS_hyperventilation_bpm);
    config.alerts.breathing_increase_factor = absl::GetFlag(FLAGS_breathing_increase_factor);
    config.alerts.minimal_eye_contact_pct   = absl::GetFlag(FLAGS_minimal_eye_contact_pct);
    config.alerts.dissociation_gaze_pct     = absl::GetFlag(FLAGS_dissociation_gaze_pct);
    config.alerts.anxiety_gaze_pct          = absl::GetFlag(FLAGS_anxiety_gaze_pct);
    config.alerts.dedup_window_sec          = absl::GetFlag(FLAGS_alert_dedup_sec);

    // The report reads the same clinical thresholds the live alerts use
    config.report.segment_sec           = absl::GetFlag(FLAGS_segment_sec);
    config.report.hyperventilation_bpm  = config.alerts.hyperventilation_bpm;
    config.report.minimal_eye_contact_pct = config.alerts.minimal_eye_contact_pct;
    config.report.anxiety_gaze_pct      = config.alerts.anxiety_gaze_pct;
    config.report.dissociation_gaze_pct = config.alerts.dissociation_gaze_pct;

    if (auto status = tl::validate_extractor_config(config.extractors); !status.ok()) {
        return status;
    }
    if (config.sample_cadence_ms <= 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("--sample_cadence_ms must be positive, got ", config.sample_cadence_ms));
    }
    return config;
}

// ── Commands ─────────────────────────────────────────────
void apply_pending_commands(tl::SessionEngine& engine, bool consent, const tl::Baselines& baselines) {
    for (tl::SessionCommand command : g_commands->drain()) {
        auto status = tl::apply_session_command(engine, command, consent, baselines);
        if (!status.ok()) {
            LOG(WARNING) << "Command '" << tl::session_command_to_string(command)
                         << "' rejected: " << status.message();
        }
    }
}

// ── Report file ──────────────────────────────────────────
absl::Status write_report_file(const tl::SessionEngine& engine,
                               const std::string& patient_id,
                               const std::string& path) {
    const auto& report = engine.session().report();
    if (!report) {
        return absl::FailedPreconditionError("No report was produced");
    }
    const auto& log = engine.session().alerts().entries();
    std::vector<tl::Alert> alerts(log.begin(), log.end());

    std::ofstream out(path);
    if (!out) {
        return absl::UnavailableError(absl::StrCat("Cannot open ", path, " for writing"));
    }
    out << tl::export_report_json(*report, patient_id, alerts) << "\n";
    if (!out) {
        return absl::DataLossError(absl::StrCat("Failed writing ", path));
    }
    LOG(INFO) << "Report written to " << path;
    return absl::OkStatus();
}

// ── Main ─────────────────────────────────────────────────
int main(int argc, char** argv) {
    // Logging goes to stderr so stdout stays clean for JSON
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;     // All glog output → stderr
    FLAGS_alsologtostderr = false;

    absl::SetProgramUsageMessage(
        "TherapyLens Bridge — headless clinical session runner.\n"
        "Sources: 'smartspectra' (live SDK) or 'replay' (recorded capture).\n\n"
        "Live:   therapy_lens_bridge --api_key=KEY --consent\n"
        "Replay: therapy_lens_bridge --source=replay --replay_path=capture.jsonl "
        "--consent --auto_start --report_path=report.json"
    );
    absl::ParseCommandLine(argc, argv);

    // Handle signals for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const std::string source_name = absl::GetFlag(FLAGS_source);
    const bool replay = (source_name == "replay");
    if (!replay && source_name != "smartspectra") {
        g_emitter.emit_error("Unknown --source '" + source_name + "'. Use 'smartspectra' or 'replay'.");
        return 1;
    }

    const std::string patient_id = flag_or_env(absl::GetFlag(FLAGS_patient_id),
                                               "THERAPY_LENS_PATIENT_ID");
    const bool consent = absl::GetFlag(FLAGS_consent);
    tl::Baselines baselines;
    baselines.baseline_breathing_bpm   = absl::GetFlag(FLAGS_baseline_breathing_bpm);
    baselines.baseline_eye_contact_pct = absl::GetFlag(FLAGS_baseline_eye_contact_pct);

    try {
        // ── Clock & Source ───────────────────────────────
        std::unique_ptr<tl::Clock> clock;
        std::unique_ptr<tl::LandmarkSource> source;

        if (replay) {
            const std::string path = absl::GetFlag(FLAGS_replay_path);
            if (path.empty()) {
                g_emitter.emit_error("Replay source requires --replay_path.");
                return 1;
            }
            auto manual_clock = std::make_unique<tl::ManualClock>();
            source = std::make_unique<tl::ReplayLandmarkSource>(path, *manual_clock, *g_commands);
            clock = std::move(manual_clock);
            g_emitter.emit_status("Starting in REPLAY mode (" + path + ")...");
        } else {
            tl::SmartSpectraOptions options;
            options.api_key = flag_or_env(absl::GetFlag(FLAGS_api_key), "SMARTSPECTRA_API_KEY");
            if (options.api_key.empty()) {
                g_emitter.emit_error("No API key provided. Use --api_key=KEY or set SMARTSPECTRA_API_KEY");
                return 1;
            }
            options.server_mode = (absl::GetFlag(FLAGS_mode) == "server");
            options.camera_device_index = absl::GetFlag(FLAGS_camera_device_index);
            options.capture_width       = absl::GetFlag(FLAGS_capture_width);
            options.capture_height      = absl::GetFlag(FLAGS_capture_height);
            options.file_stream_path    = absl::GetFlag(FLAGS_file_stream_path);
            options.rescan_delay_ms     = absl::GetFlag(FLAGS_rescan_delay_ms);
            options.erase_read_files    = absl::GetFlag(FLAGS_erase_read_files);

            if (options.server_mode) {
                if (options.file_stream_path.empty()) {
                    g_emitter.emit_error("Server mode requires --file_stream_path. "
                        "Example: --file_stream_path=/tmp/therapy_frames/frame0000000000000000.png");
                    return 1;
                }
                g_emitter.emit_status("Starting in SERVER mode (reading frames from directory)...");
            } else {
                g_emitter.emit_status("Starting in LOCAL mode (capturing webcam)...");
            }

            clock = std::make_unique<tl::SteadyClock>();
            source = std::make_unique<tl::SmartSpectraLandmarkSource>(
                std::move(options),
                [](const std::string& status) { g_emitter.emit_status(status); },
                []() { g_emitter.emit_ready("smartspectra"); }
            );
        }

        // ── Session Engine ───────────────────────────────
        std::unique_ptr<tl::InsightGenerator> insight_generator;
        if (const std::string command = absl::GetFlag(FLAGS_insight_command); !command.empty()) {
            const int64_t timeout_ms = absl::GetFlag(FLAGS_insight_timeout_ms);
            if (timeout_ms <= 0) {
                g_emitter.emit_error("--insight_timeout_ms must be positive.");
                return 1;
            }
            insight_generator = std::make_unique<tl::CommandInsightGenerator>(
                command, absl::Milliseconds(timeout_ms));
        }

        auto config = session_config_from_flags();
        if (!config.ok()) {
            g_emitter.emit_error("Invalid configuration: " + std::string(config.status().message()));
            return 1;
        }
        tl::SessionEngine engine(*clock, *std::move(config), insight_generator.get());
        tl::JsonLinesObserver observer(g_emitter, patient_id);
        engine.add_observer(&observer);

        // Callbacks may arrive on SDK threads; every engine call holds this
        std::mutex engine_mutex;

        if (absl::GetFlag(FLAGS_auto_start)) {
            g_commands->push(tl::SessionCommand::START);
        }
        tl::start_command_reader(std::cin, g_commands, []() { g_stdin_closed = true; });

        auto handler = [&](const std::optional<tl::LandmarkSnapshot>& snapshot) -> absl::Status {
            if (g_shutdown_requested) {
                return absl::CancelledError("Shutdown requested");
            }
            // Live sessions follow the dashboard: a closed pipe means it is gone
            if (!replay && g_stdin_closed) {
                return absl::CancelledError("Command channel closed");
            }
            std::lock_guard<std::mutex> lock(engine_mutex);
            apply_pending_commands(engine, consent, baselines);
            engine.on_frame(snapshot);
            return absl::OkStatus();
        };

        if (replay) {
            g_emitter.emit_ready("replay");
        }

        // Live sampling runs on its own timer so a stalled camera still
        // yields one sample per period. Replay catches up inside on_frame.
        std::atomic<bool> sampling_done{false};
        std::thread sampling_thread;
        if (!replay) {
            sampling_thread = std::thread([&]() {
                while (!sampling_done) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(kSamplingPollMs));
                    // Frames may have stopped, so the frame handler cannot be
                    // relied on to notice shutdown
                    if (g_shutdown_requested || g_stdin_closed) {
                        source->request_stop();
                    }
                    std::lock_guard<std::mutex> lock(engine_mutex);
                    apply_pending_commands(engine, consent, baselines);
                    engine.poll();
                }
            });
        }
        absl::Cleanup stop_sampling = [&]() {
            sampling_done = true;
            if (sampling_thread.joinable()) {
                sampling_thread.join();
            }
        };

        // ── Run (blocks until cancelled, exhausted or error) ──
        int exit_code = 0;
        if (auto run_status = source->run(handler); !run_status.ok()) {
            // CancelledError is expected on graceful shutdown
            if (run_status.code() != absl::StatusCode::kCancelled) {
                g_emitter.emit_error("Processing failed: " + std::string(run_status.message()));
                exit_code = 1;
            }
        }

        std::move(stop_sampling).Invoke();

        // ── Finish the session ───────────────────────────
        std::lock_guard<std::mutex> lock(engine_mutex);
        apply_pending_commands(engine, consent, baselines);

        const tl::SessionPhase phase = engine.session().phase();
        if (phase == tl::SessionPhase::ACTIVE || phase == tl::SessionPhase::PAUSED) {
            LOG(INFO) << "Ending unfinished session on shutdown";
            if (auto status = engine.end(); !status.ok()) {
                LOG(WARNING) << "End rejected: " << status.message();
            }
        }

        if (const std::string path = absl::GetFlag(FLAGS_report_path);
            !path.empty() && engine.session().report()) {
            if (auto status = write_report_file(engine, patient_id, path); !status.ok()) {
                g_emitter.emit_error("Report not saved: " + std::string(status.message()));
                exit_code = 1;
            }
        }

        g_emitter.emit_status("Shutting down...");
        return exit_code;

    } catch (const std::exception& e) {
        g_emitter.emit_error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
