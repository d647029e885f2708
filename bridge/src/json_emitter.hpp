/**
 * json_emitter.hpp — JSON Lines channel to the dashboard
 *
 * One JSON object per line on stdout, each of the form
 * { "type": "<kind>", "data": { ... } }. The dashboard reads them
 * line-by-line; glog output goes to stderr and never mixes in.
 *
 *   type     | data
 *   ---------+-------------------------------------------------
 *   state    | { "state": "active|paused|ended", "elapsed_sec" }
 *   sample   | one MetricSample
 *   alert    | one Alert
 *   report   | the exported SessionReport
 *   status   | { "status": "..." }   (SDK / lifecycle text)
 *   error    | { "message": "..." }
 *   ready    | { "source": "smartspectra|replay" }
 */

#pragma once

#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

#include <json/json.h>

namespace therapy_lens {

class JsonEmitter {
public:
    explicit JsonEmitter(std::ostream& out = std::cout);

    /**
     * Write one line. `json_data` must already be valid JSON.
     * Thread-safe: the SDK callbacks and the stdin reader share one emitter.
     */
    void emit(const std::string& type, const std::string& json_data);
    void emit(const std::string& type, const Json::Value& data);

    void emit_status(const std::string& status_text);
    void emit_error(const std::string& error_text);

    // The landmark source is up and frames are about to flow
    void emit_ready(const std::string& source);

    /**
     * Quote-free JSON escaping of `input`, for callers that assemble
     * lines with a stream.
     */
    static std::string escape_json_string(const std::string& input);

private:
    std::ostream& out_;
    std::mutex write_mutex_;
    Json::StreamWriterBuilder writer_;
};

} // namespace therapy_lens
