/**
 * replay_source.cpp — Implementation
 */

#include "replay_source.hpp"

#include <fstream>
#include <initializer_list>
#include <map>
#include <memory>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <glog/logging.h>
#include <json/json.h>

#include "expression_mapper.hpp"

namespace therapy_lens {

namespace {

absl::StatusOr<std::map<std::string, float>> score_map(const Json::Value& obj, const char* field) {
    if (!obj.isObject()) {
        return absl::InvalidArgumentError(absl::StrCat("'", field, "' must be an object"));
    }
    std::map<std::string, float> scores;
    for (const auto& name : obj.getMemberNames()) {
        if (!obj[name].isNumeric()) {
            return absl::InvalidArgumentError(
                absl::StrCat("'", field, ".", name, "' must be a number"));
        }
        scores[name] = obj[name].asFloat();
    }
    return scores;
}

} // namespace

absl::StatusOr<ReplayFrame> parse_replay_line(absl::string_view line) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(line.data(), line.data() + line.size(), &root, &errors)) {
        return absl::InvalidArgumentError(absl::StrCat("Not JSON: ", errors));
    }
    if (!root.isObject() || !root.isMember("t_ms") || !root["t_ms"].isInt64()) {
        return absl::InvalidArgumentError("Replay line needs an integer 't_ms'");
    }

    ReplayFrame frame;
    frame.t_ms = root["t_ms"].asInt64();

    if (root.isMember("command")) {
        if (!root["command"].isString()) {
            return absl::InvalidArgumentError("'command' must be a string");
        }
        frame.command = parse_session_command(root["command"].asString());
        if (!frame.command) {
            return absl::InvalidArgumentError(
                absl::StrCat("Unknown command '", root["command"].asString(), "'"));
        }
    }

    bool face = true;
    if (root.isMember("face")) {
        if (!root["face"].isBool()) {
            return absl::InvalidArgumentError("'face' must be a boolean");
        }
        face = root["face"].asBool();
    }
    if (!face || !root.isMember("points")) {
        return frame;
    }

    const Json::Value& points = root["points"];
    if (!points.isObject()) {
        return absl::InvalidArgumentError("'points' must be an object");
    }

    LandmarkSnapshot snapshot;
    snapshot.captured_at_ms = frame.t_ms;
    for (const char* dim : {"width", "height"}) {
        if (root.isMember(dim) && !root[dim].isInt()) {
            return absl::InvalidArgumentError(absl::StrCat("'", dim, "' must be an integer"));
        }
    }
    snapshot.frame_width = root.get("width", Json::Value(0)).asInt();
    snapshot.frame_height = root.get("height", Json::Value(0)).asInt();

    for (const auto& name : points.getMemberNames()) {
        const Json::Value& xy = points[name];
        if (!xy.isArray() || xy.size() != 2 || !xy[0].isNumeric() || !xy[1].isNumeric()) {
            return absl::InvalidArgumentError(
                absl::StrCat("Landmark '", name, "' must be [x, y]"));
        }
        snapshot.points[name] = Point2{xy[0].asFloat(), xy[1].asFloat()};
    }

    if (root.isMember("blendshapes") || root.isMember("expressions")) {
        std::map<std::string, float> scores;
        if (root.isMember("blendshapes")) {
            auto blendshapes = score_map(root["blendshapes"], "blendshapes");
            if (!blendshapes.ok()) return blendshapes.status();
            scores = blendshapes_to_expressions(*blendshapes);
        }
        if (root.isMember("expressions")) {
            auto expressions = score_map(root["expressions"], "expressions");
            if (!expressions.ok()) return expressions.status();
            // Direct emotion scores win over blendshape-derived ones
            for (const auto& [label, score] : *expressions) {
                scores[absl::AsciiStrToLower(label)] = score;
            }
        }
        snapshot.expression_scores = std::move(scores);
    }

    frame.snapshot = std::move(snapshot);
    return frame;
}

ReplayLandmarkSource::ReplayLandmarkSource(std::string path, ManualClock& clock, CommandQueue& commands)
    : path_(std::move(path))
    , clock_(clock)
    , commands_(commands)
{
}

absl::Status ReplayLandmarkSource::run(const SnapshotHandler& handler) {
    std::ifstream in(path_);
    if (!in) {
        return absl::NotFoundError(absl::StrCat("Cannot open replay file ", path_));
    }
    LOG(INFO) << "Replaying landmarks from " << path_;

    std::string line;
    int64_t line_no = 0;
    while (!stop_requested_ && std::getline(in, line)) {
        ++line_no;
        if (absl::StripAsciiWhitespace(line).empty()) {
            continue;
        }

        auto frame = parse_replay_line(line);
        if (!frame.ok()) {
            ++lines_skipped_;
            LOG(WARNING) << path_ << ":" << line_no << ": " << frame.status().message();
            continue;
        }

        clock_.set_ms(frame->t_ms);
        if (frame->command) {
            commands_.push(*frame->command);
        }
        ++frames_read_;

        if (auto status = handler(frame->snapshot); !status.ok()) {
            return status;
        }
    }

    LOG(INFO) << "Replay finished: " << frames_read_ << " frames, "
              << lines_skipped_ << " malformed lines skipped";
    return absl::OkStatus();
}

} // namespace therapy_lens
