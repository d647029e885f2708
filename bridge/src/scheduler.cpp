/**
 * scheduler.cpp — Implementation
 */

#include "scheduler.hpp"

#include <utility>

#include <absl/strings/str_cat.h>

namespace therapy_lens {

Scheduler::Scheduler(const Clock& clock)
    : clock_(clock)
{
}

absl::Status Scheduler::add_periodic(const std::string& name, int64_t period_ms, Task task) {
    if (period_ms <= 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Task '", name, "' needs a positive period, got ", period_ms));
    }
    if (!task) {
        return absl::InvalidArgumentError(absl::StrCat("Task '", name, "' has no body"));
    }
    PeriodicTask& entry = tasks_[name];
    entry.period_ms = period_ms;
    entry.armed = false;
    entry.task = std::move(task);
    return absl::OkStatus();
}

absl::Status Scheduler::arm(const std::string& name) {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return absl::NotFoundError(absl::StrCat("No task named '", name, "'"));
    }
    it->second.next_due_ms = clock_.now_ms() + it->second.period_ms;
    it->second.armed = true;
    return absl::OkStatus();
}

absl::Status Scheduler::disarm(const std::string& name) {
    auto it = tasks_.find(name);
    if (it == tasks_.end()) {
        return absl::NotFoundError(absl::StrCat("No task named '", name, "'"));
    }
    it->second.armed = false;
    return absl::OkStatus();
}

bool Scheduler::is_armed(const std::string& name) const {
    auto it = tasks_.find(name);
    return it != tasks_.end() && it->second.armed;
}

int Scheduler::poll() {
    return poll_until(clock_.now_ms());
}

int Scheduler::poll_until(int64_t limit_ms) {
    int ran = 0;

    for (auto& [name, entry] : tasks_) {
        // Advance before running so the task may disarm itself
        while (entry.armed && entry.next_due_ms <= limit_ms) {
            const int64_t due = entry.next_due_ms;
            entry.next_due_ms += entry.period_ms;
            entry.task(due);
            ++ran;
        }
    }
    return ran;
}

} // namespace therapy_lens
