/**
 * scheduler.hpp — Cooperative periodic tasks on an injected clock
 *
 * Nothing here owns a thread. The host calls poll() from its own loop
 * (a timer thread in live mode, the replay loop otherwise) and every
 * armed task whose due time has passed runs inline, once per elapsed
 * period. A task receives the time it was due, not the time it ran.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include <absl/status/status.h>

#include "clock.hpp"

namespace therapy_lens {

class Scheduler {
public:
    using Task = std::function<void(int64_t due_ms)>;

    explicit Scheduler(const Clock& clock);

    /**
     * Register a named task. It does not run until arm() is called.
     */
    absl::Status add_periodic(const std::string& name, int64_t period_ms, Task task);

    /**
     * Start (or restart) a task. The first run is one full period from now.
     */
    absl::Status arm(const std::string& name);

    /**
     * Stop a task. Takes effect immediately, even from inside poll().
     */
    absl::Status disarm(const std::string& name);

    bool is_armed(const std::string& name) const;

    /**
     * Run every armed task that is due by now. A task that fell behind
     * runs once for each missed period, in order. Returns the number of
     * task invocations.
     */
    int poll();

    /**
     * Same as poll(), but only runs periods due at or before `limit_ms`.
     */
    int poll_until(int64_t limit_ms);

private:
    struct PeriodicTask {
        int64_t period_ms   = 0;
        int64_t next_due_ms = 0;
        bool    armed       = false;
        Task    task;
    };

    const Clock& clock_;
    std::map<std::string, PeriodicTask> tasks_;
};

} // namespace therapy_lens
