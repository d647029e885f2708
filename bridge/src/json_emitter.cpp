/**
 * json_emitter.cpp — Implementation
 */

#include "json_emitter.hpp"

namespace therapy_lens {

namespace {

Json::StreamWriterBuilder compact_writer() {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return builder;
}

} // namespace

JsonEmitter::JsonEmitter(std::ostream& out)
    : out_(out)
    , writer_(compact_writer())
{
}

void JsonEmitter::emit(const std::string& type, const std::string& json_data) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << "{\"type\":\"" << type << "\",\"data\":" << json_data << "}" << std::endl;
    // std::endl flushes; the reader on the other end of the pipe waits on it
}

void JsonEmitter::emit(const std::string& type, const Json::Value& data) {
    emit(type, Json::writeString(writer_, data));
}

void JsonEmitter::emit_status(const std::string& status_text) {
    Json::Value data(Json::objectValue);
    data["status"] = status_text;
    emit("status", data);
}

void JsonEmitter::emit_error(const std::string& error_text) {
    Json::Value data(Json::objectValue);
    data["message"] = error_text;
    emit("error", data);
}

void JsonEmitter::emit_ready(const std::string& source) {
    Json::Value data(Json::objectValue);
    data["source"] = source;
    emit("ready", data);
}

std::string JsonEmitter::escape_json_string(const std::string& input) {
    static const Json::StreamWriterBuilder writer = compact_writer();
    const std::string quoted = Json::writeString(writer, Json::Value(input));
    // Strip the surrounding quotes
    return quoted.substr(1, quoted.size() - 2);
}

} // namespace therapy_lens
