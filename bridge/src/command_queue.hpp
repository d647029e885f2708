/**
 * command_queue.hpp — Session control commands from the dashboard
 *
 * The dashboard writes one command per line to the bridge's stdin:
 *   start | pause | resume | toggle | end
 *
 * A reader thread pushes parsed commands here; the processing thread
 * drains and applies them, so the engine keeps a single writer.
 */

#pragma once

#include <deque>
#include <functional>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <absl/status/status.h>
#include <absl/strings/string_view.h>

#include "metric_sample.hpp"
#include "session_engine.hpp"

namespace therapy_lens {

enum class SessionCommand {
    START,
    PAUSE,
    RESUME,
    TOGGLE,
    END
};

const char* session_command_to_string(SessionCommand command);

/**
 * Case-insensitive, surrounding whitespace ignored.
 */
std::optional<SessionCommand> parse_session_command(absl::string_view text);

class CommandQueue {
public:
    void push(SessionCommand command);

    /**
     * Take every queued command, oldest first.
     */
    std::vector<SessionCommand> drain();

private:
    std::mutex mutex_;
    std::deque<SessionCommand> pending_;
};

/**
 * Read commands from `in`, one per line, on a detached thread and push
 * them into `queue`. Unknown lines are logged and dropped. `on_eof` runs
 * on the reader thread once `in` is exhausted.
 *
 * The thread holds its own reference to `queue`, so the queue stays valid
 * for as long as the reader can push, even while the process is exiting.
 * `in` must outlive the thread (std::cin does).
 */
void start_command_reader(std::istream& in,
                          std::shared_ptr<CommandQueue> queue,
                          std::function<void()> on_eof);

/**
 * Apply one command. Consent and baselines are only read by START.
 */
absl::Status apply_session_command(SessionEngine& engine,
                                   SessionCommand command,
                                   bool consent,
                                   const Baselines& baselines);

} // namespace therapy_lens
