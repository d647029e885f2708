/**
 * command_queue.cpp — Implementation
 */

#include "command_queue.hpp"

#include <string>
#include <thread>
#include <utility>

#include <absl/strings/ascii.h>
#include <glog/logging.h>

namespace therapy_lens {

const char* session_command_to_string(SessionCommand command) {
    switch (command) {
        case SessionCommand::START:  return "start";
        case SessionCommand::PAUSE:  return "pause";
        case SessionCommand::RESUME: return "resume";
        case SessionCommand::TOGGLE: return "toggle";
        case SessionCommand::END:    return "end";
        default:                     return "unknown";
    }
}

std::optional<SessionCommand> parse_session_command(absl::string_view text) {
    const std::string word = absl::AsciiStrToLower(absl::StripAsciiWhitespace(text));
    if (word == "start")  return SessionCommand::START;
    if (word == "pause")  return SessionCommand::PAUSE;
    if (word == "resume") return SessionCommand::RESUME;
    if (word == "toggle") return SessionCommand::TOGGLE;
    if (word == "end")    return SessionCommand::END;
    return std::nullopt;
}

void CommandQueue::push(SessionCommand command) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.push_back(command);
}

std::vector<SessionCommand> CommandQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionCommand> commands(pending_.begin(), pending_.end());
    pending_.clear();
    return commands;
}

void start_command_reader(std::istream& in,
                          std::shared_ptr<CommandQueue> queue,
                          std::function<void()> on_eof) {
    // Detached: a blocking getline cannot be interrupted
    std::thread([&in, queue = std::move(queue), on_eof = std::move(on_eof)]() {
        std::string line;
        while (std::getline(in, line)) {
            auto command = parse_session_command(line);
            if (!command) {
                if (!absl::StripAsciiWhitespace(line).empty()) {
                    LOG(WARNING) << "Ignoring unknown command '" << line << "'";
                }
                continue;
            }
            queue->push(*command);
        }
        if (on_eof) {
            on_eof();
        }
    }).detach();
}

absl::Status apply_session_command(SessionEngine& engine,
                                   SessionCommand command,
                                   bool consent,
                                   const Baselines& baselines) {
    switch (command) {
        case SessionCommand::START:  return engine.start(consent, baselines);
        case SessionCommand::PAUSE:  return engine.pause();
        case SessionCommand::RESUME: return engine.resume();
        case SessionCommand::TOGGLE: return engine.toggle_pause();
        case SessionCommand::END:    return engine.end();
    }
    return absl::InvalidArgumentError("Unknown session command");
}

} // namespace therapy_lens
