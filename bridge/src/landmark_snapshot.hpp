/**
 * landmark_snapshot.hpp — Output contract of a face-landmark backend
 *
 * Every backend (SmartSpectra dense face mesh, recorded replay files, ...)
 * reduces a processed video frame to a LandmarkSnapshot: named 2-D points
 * in image pixel space plus, when the backend has them, expression scores.
 *
 * A frame with no face is delivered as std::nullopt. Consumers never
 * distinguish a single missed frame from a long absence.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <absl/status/status.h>

namespace therapy_lens {

// ── Landmark ids read by the extractors ─────────────────
namespace landmarks {
inline constexpr char kNoseTip[]  = "noseTip";
inline constexpr char kUpperLip[] = "upperLip";
inline constexpr char kLowerLip[] = "lowerLip";
} // namespace landmarks

struct Point2 {
    float x = 0.0f;
    float y = 0.0f;
};

struct LandmarkSnapshot {
    // Named landmark -> (x, y) in pixels
    std::map<std::string, Point2> points;

    // Emotion label -> confidence in [0,1]; absent when the backend
    // produced no expression data for this frame
    std::optional<std::map<std::string, float>> expression_scores;

    int frame_width  = 0;
    int frame_height = 0;

    // Monotonic capture time
    int64_t captured_at_ms = 0;

    /**
     * Look up a landmark by id. Returns nullptr if the backend did not
     * provide it this frame.
     */
    const Point2* find_point(const std::string& id) const;
};

/**
 * Receives one entry per processed frame. A non-OK return stops the source.
 */
using SnapshotHandler =
    std::function<absl::Status(const std::optional<LandmarkSnapshot>&)>;

/**
 * A producer of LandmarkSnapshots. Backends are interchangeable and
 * selected by configuration.
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /**
     * Deliver snapshots to the handler until the stream ends, the handler
     * returns an error, or request_stop() is called. Blocks.
     */
    virtual absl::Status run(const SnapshotHandler& handler) = 0;

    /**
     * Ask a running source to return from run() at the next frame.
     * Safe to call from another thread.
     */
    virtual void request_stop() = 0;
};

} // namespace therapy_lens
