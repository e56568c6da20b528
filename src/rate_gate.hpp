#pragma once
#include "include/cmdgate.hpp"
#include <deque>

namespace cmdgate {

// RateGate: rolling-window budget plus minimum spacing between calls.
// Not synchronized; the dispatcher owns it under its own lock.
class RateGate {
public:
    RateGate(size_t window_capacity, Duration window_duration, Duration min_spacing);

    // Pure admission check. When it returns true the caller must call
    // record_call(now) before releasing its lock.
    bool try_acquire(TimePoint now) const;
    void record_call(TimePoint now);

    // Earliest instant at which try_acquire would return true.
    TimePoint next_allowed(TimePoint now) const;

    size_t calls_in_window(TimePoint now) const;
    size_t window_capacity() const { return window_capacity_; }
    Duration window_duration() const { return window_duration_; }
    Duration min_spacing() const { return min_spacing_; }

private:
    void prune(TimePoint now);
    // first index of call_timestamps_ still inside the window at `now`
    size_t first_live(TimePoint now) const;

    size_t window_capacity_;
    Duration window_duration_;
    Duration min_spacing_;
    std::deque<TimePoint> call_timestamps_;
    bool has_last_call_ = false;
    TimePoint last_call_{};
};

} // namespace cmdgate
