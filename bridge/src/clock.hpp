/**
 * clock.hpp — Injected time sources
 *
 * The engine never reads the system clock directly. Live runs use
 * SteadyClock; tests and replays drive a ManualClock so that sampling
 * cadence, pause accounting and alert dedup are fully deterministic.
 */

#pragma once

#include <cstdint>

#include <absl/time/time.h>

namespace therapy_lens {

class Clock {
public:
    virtual ~Clock() = default;

    /**
     * Monotonic milliseconds. Only differences are meaningful.
     */
    virtual int64_t now_ms() const = 0;

    /**
     * Wall-clock time, used to stamp alerts.
     */
    virtual absl::Time wall_now() const = 0;
};

class SteadyClock : public Clock {
public:
    int64_t now_ms() const override;
    absl::Time wall_now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start_ms = 0,
                         absl::Time wall_epoch = absl::UnixEpoch());

    int64_t now_ms() const override { return now_ms_; }
    absl::Time wall_now() const override;

    void advance_ms(int64_t delta_ms);

    /**
     * Jump to an absolute time. Requests to move backwards are ignored.
     */
    void set_ms(int64_t t_ms);

private:
    int64_t now_ms_;
    int64_t start_ms_;
    absl::Time wall_epoch_;
};

} // namespace therapy_lens
