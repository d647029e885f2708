/**
 * rolling_window.hpp — Time-bounded FIFO of timestamped observations
 *
 * Entries are evicted by age relative to the newest push, not by count,
 * so the effective averaging window does not change with frame rate.
 * Not thread-safe.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace therapy_lens {

template <typename T>
class RollingWindow {
public:
    struct Entry {
        int64_t t_ms;
        T value;
    };

    explicit RollingWindow(int64_t window_ms) : window_ms_(window_ms) {}

    /**
     * Append an observation and drop everything that is window_ms or
     * older relative to it.
     */
    void push(int64_t t_ms, const T& value) {
        entries_.push_back(Entry{t_ms, value});
        evict(t_ms);
    }

    void evict(int64_t now_ms) {
        while (!entries_.empty() && now_ms - entries_.front().t_ms >= window_ms_) {
            entries_.pop_front();
        }
    }

    /**
     * Time between oldest and newest entry.
     */
    int64_t span_ms() const {
        if (entries_.empty()) return 0;
        return entries_.back().t_ms - entries_.front().t_ms;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    void clear() { entries_.clear(); }
    int64_t window_ms() const { return window_ms_; }

    const std::deque<Entry>& entries() const { return entries_; }

private:
    int64_t window_ms_;
    std::deque<Entry> entries_;
};

} // namespace therapy_lens
