/**
 * clock.cpp — Implementation
 */

#include "clock.hpp"

#include <algorithm>
#include <chrono>

#include <absl/time/clock.h>

namespace therapy_lens {

int64_t SteadyClock::now_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

absl::Time SteadyClock::wall_now() const {
    return absl::Now();
}

ManualClock::ManualClock(int64_t start_ms, absl::Time wall_epoch)
    : now_ms_(start_ms)
    , start_ms_(start_ms)
    , wall_epoch_(wall_epoch)
{
}

absl::Time ManualClock::wall_now() const {
    return wall_epoch_ + absl::Milliseconds(now_ms_ - start_ms_);
}

void ManualClock::advance_ms(int64_t delta_ms) {
    if (delta_ms > 0) {
        now_ms_ += delta_ms;
    }
}

void ManualClock::set_ms(int64_t t_ms) {
    now_ms_ = std::max(now_ms_, t_ms);
}

} // namespace therapy_lens
