/**
 * replay_source.hpp — Landmark snapshots from a recorded JSON Lines file
 *
 * One frame per line:
 *   {"t_ms":1200,"width":640,"height":480,
 *    "points":{"noseTip":[320,240],"upperLip":[320,270]},
 *    "expressions":{"happy":0.6},          // optional
 *    "blendshapes":{"mouthSmileLeft":0.7}, // optional, mapped to emotions
 *    "command":"start"}                    // optional session control
 *   {"t_ms":1233,"face":false}
 *
 * A line without "points" (or with "face":false) is a no-face frame.
 * Replay drives a ManualClock from t_ms, so a replayed session samples,
 * pauses and alerts exactly as it did live, independent of wall time.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include "clock.hpp"
#include "command_queue.hpp"
#include "landmark_snapshot.hpp"

namespace therapy_lens {

struct ReplayFrame {
    int64_t t_ms = 0;
    std::optional<LandmarkSnapshot> snapshot;
    std::optional<SessionCommand> command;
};

absl::StatusOr<ReplayFrame> parse_replay_line(absl::string_view line);

class ReplayLandmarkSource : public LandmarkSource {
public:
    ReplayLandmarkSource(std::string path, ManualClock& clock, CommandQueue& commands);

    absl::Status run(const SnapshotHandler& handler) override;
    void request_stop() override { stop_requested_ = true; }

    int64_t frames_read() const { return frames_read_; }
    int64_t lines_skipped() const { return lines_skipped_; }

private:
    std::string path_;
    ManualClock& clock_;
    CommandQueue& commands_;
    std::atomic<bool> stop_requested_{false};
    int64_t frames_read_ = 0;
    int64_t lines_skipped_ = 0;
};

} // namespace therapy_lens
