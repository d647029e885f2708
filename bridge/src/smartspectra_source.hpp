/**
 * smartspectra_source.hpp — Landmark snapshots from the SmartSpectra SDK
 *
 * Runs a headless SmartSpectra container in one of two modes:
 *
 *   LOCAL  — captures the webcam directly on this machine.
 *   SERVER — reads frames a relay writes into a directory as numbered PNGs
 *            (SmartSpectra file_stream input).
 *
 * Edge metrics (computed per-frame on-device) carry the dense face mesh.
 * The landmarks the extractors need are picked out of it by MediaPipe
 * index and converted into a LandmarkSnapshot. SmartSpectra has no
 * emotion model, so snapshots from this source carry no expression scores.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <physiology/modules/messages/metrics.h>

#include "landmark_snapshot.hpp"

namespace therapy_lens {

// ── MediaPipe face mesh indices ──────────────────────────
namespace face_mesh {
inline constexpr int kPointCount  = 468;
inline constexpr int kNoseTip     = 1;
inline constexpr int kUpperLip    = 13;
inline constexpr int kLowerLip    = 14;
inline constexpr int kForehead    = 10;
inline constexpr int kChin        = 152;
inline constexpr int kLeftCheek   = 234;
inline constexpr int kRightCheek  = 454;
} // namespace face_mesh

struct SmartSpectraOptions {
    std::string api_key;
    bool server_mode = false;

    // Local mode
    int camera_device_index = 0;
    int capture_width = 1280;
    int capture_height = 720;

    // Server mode
    std::string file_stream_path;
    int rescan_delay_ms = 5;
    bool erase_read_files = true;

    int verbosity_level = 1;
};

/**
 * Convert one edge-metrics message. Returns nullopt when there is no face
 * or the mesh is incomplete.
 */
std::optional<LandmarkSnapshot> snapshot_from_edge_metrics(
    const presage::physiology::Metrics& metrics,
    int64_t timestamp_us,
    int frame_width,
    int frame_height
);

class SmartSpectraLandmarkSource : public LandmarkSource {
public:
    using StatusCallback = std::function<void(const std::string&)>;
    using ReadyCallback = std::function<void()>;

    /**
     * `on_status` receives SDK imaging status descriptions. `on_ready`
     * fires once the pipeline is initialized, just before it starts running.
     */
    SmartSpectraLandmarkSource(SmartSpectraOptions options,
                               StatusCallback on_status,
                               ReadyCallback on_ready);

    absl::Status run(const SnapshotHandler& handler) override;
    void request_stop() override { stop_requested_ = true; }

private:
    SmartSpectraOptions options_;
    StatusCallback on_status_;
    ReadyCallback on_ready_;
    std::atomic<bool> stop_requested_{false};

    // Written by the video callback, read by the edge callback
    std::atomic<int> frame_width_{0};
    std::atomic<int> frame_height_{0};
};

} // namespace therapy_lens
