/**
 * smartspectra_source.cpp — Implementation
 *
 * SDK API reference (protobuf-generated classes):
 *   Metrics (edge): breathing(), micromotion(), eda(), face()
 *   Face: blinking(), talking(), landmarks()
 *   Landmarks: value(i) -> Point2dFloat { x(), y() } in frame pixels
 */

#include "smartspectra_source.hpp"

#include <memory>
#include <utility>

#include <absl/status/status.h>
#include <glog/logging.h>
#include <opencv2/core.hpp>

#include <smartspectra/container/foreground_container.hpp>
#include <smartspectra/container/settings.hpp>
#include <smartspectra/video_source/camera/camera.hpp>
#include <physiology/modules/messages/status.h>

namespace therapy_lens {

namespace pcam      = presage::camera;
namespace settings  = presage::smartspectra::container::settings;
namespace container = presage::smartspectra::container;

std::optional<LandmarkSnapshot> snapshot_from_edge_metrics(
    const presage::physiology::Metrics& metrics,
    int64_t timestamp_us,
    int frame_width,
    int frame_height
) {
    if (!metrics.has_face() || metrics.face().landmarks().empty()) {
        return std::nullopt;
    }

    const auto& latest_lm = *metrics.face().landmarks().rbegin();
    if (latest_lm.value_size() < face_mesh::kPointCount) {
        return std::nullopt;
    }

    LandmarkSnapshot snapshot;
    snapshot.captured_at_ms = timestamp_us / 1000;
    snapshot.frame_width = frame_width;
    snapshot.frame_height = frame_height;

    auto take = [&](const char* id, int index) {
        const auto& p = latest_lm.value(index);
        snapshot.points[id] = Point2{p.x(), p.y()};
    };
    take(landmarks::kNoseTip, face_mesh::kNoseTip);
    take(landmarks::kUpperLip, face_mesh::kUpperLip);
    take(landmarks::kLowerLip, face_mesh::kLowerLip);
    take("forehead", face_mesh::kForehead);
    take("chin", face_mesh::kChin);
    take("leftCheek", face_mesh::kLeftCheek);
    take("rightCheek", face_mesh::kRightCheek);

    return snapshot;
}

SmartSpectraLandmarkSource::SmartSpectraLandmarkSource(SmartSpectraOptions options,
                                                       StatusCallback on_status,
                                                       ReadyCallback on_ready)
    : options_(std::move(options))
    , on_status_(std::move(on_status))
    , on_ready_(std::move(on_ready))
{
}

absl::Status SmartSpectraLandmarkSource::run(const SnapshotHandler& handler) {
    // ── Configure SmartSpectra ───────────────────────────
    settings::Settings<
        settings::OperationMode::Continuous,
        settings::IntegrationMode::Rest
    > ss_settings;

    if (options_.server_mode) {
        // Frames arrive as numbered PNGs; FileStreamVideoSource picks them up
        ss_settings.video_source.file_stream_path      = options_.file_stream_path;
        ss_settings.video_source.rescan_retry_delay_ms = options_.rescan_delay_ms;
        ss_settings.video_source.erase_read_files      = options_.erase_read_files;
    } else {
        ss_settings.video_source.device_index      = options_.camera_device_index;
        ss_settings.video_source.capture_width_px  = options_.capture_width;
        ss_settings.video_source.capture_height_px = options_.capture_height;
        ss_settings.video_source.codec             = pcam::CaptureCodec::MJPG;
        ss_settings.video_source.auto_lock         = true;
    }
    // Leave input_video_path empty so the factory picks camera / file_stream
    ss_settings.video_source.input_video_path      = "";
    ss_settings.video_source.input_video_time_path = "";

    ss_settings.headless = true;
    // No GUI, so nobody presses "s"; without this the pipeline never starts
    ss_settings.start_with_recording_on = true;
    ss_settings.enable_edge_metrics = true;
    ss_settings.enable_dense_facemesh_points = true;
    ss_settings.verbosity_level = options_.verbosity_level;
    ss_settings.continuous.preprocessed_data_buffer_duration_s = 0.2;
    ss_settings.integration.api_key = options_.api_key;

    auto ss_container = std::make_unique<
        container::CpuContinuousRestForegroundContainer
    >(ss_settings);

    // ── Edge Metrics Callback ────────────────────────────
    // Fires per-frame; a frame without a usable face mesh is a no-face tick
    auto edge_status = ss_container->SetOnEdgeMetricsOutput(
        [this, &handler](const presage::physiology::Metrics& metrics, int64_t timestamp) {
            if (stop_requested_) {
                return absl::CancelledError("Shutdown requested");
            }
            return handler(snapshot_from_edge_metrics(
                metrics, timestamp, frame_width_.load(), frame_height_.load()));
        }
    );
    if (!edge_status.ok()) {
        return edge_status;
    }

    // ── Video Output Callback (headless) ─────────────────
    // Only used to learn the frame size and to check for shutdown
    auto video_status = ss_container->SetOnVideoOutput(
        [this](cv::Mat& frame, int64_t timestamp) {
            if (stop_requested_) {
                return absl::CancelledError("Shutdown requested");
            }
            frame_width_ = frame.cols;
            frame_height_ = frame.rows;
            return absl::OkStatus();
        }
    );
    if (!video_status.ok()) {
        return video_status;
    }

    // ── Status Change Callback ───────────────────────────
    auto status_cb_status = ss_container->SetOnStatusChange(
        [this](presage::physiology::StatusValue imaging_status) {
            const std::string desc = presage::physiology::GetStatusDescription(
                imaging_status.value()
            );
            VLOG(1) << "SmartSpectra status: " << desc;
            if (on_status_) {
                on_status_(desc);
            }
            return absl::OkStatus();
        }
    );
    if (!status_cb_status.ok()) {
        return status_cb_status;
    }

    // ── Initialize & Run ─────────────────────────────────
    if (auto init_status = ss_container->Initialize(); !init_status.ok()) {
        return init_status;
    }
    LOG(INFO) << "SmartSpectra pipeline initialized ("
              << (options_.server_mode ? "server" : "local") << " mode)";
    if (on_ready_) {
        on_ready_();
    }

    // Blocks until cancelled or error
    return ss_container->Run();
}

} // namespace therapy_lens
