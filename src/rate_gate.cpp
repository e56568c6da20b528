#include "rate_gate.hpp"
#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace cmdgate {

RateGate::RateGate(size_t window_capacity, Duration window_duration, Duration min_spacing)
    : window_capacity_(window_capacity), window_duration_(window_duration), min_spacing_(min_spacing)
{
    if (window_capacity_ == 0) throw std::invalid_argument("rate gate capacity must be > 0");
    if (window_duration_ <= Duration::zero()) throw std::invalid_argument("rate gate window must be > 0");
    if (min_spacing_ < Duration::zero()) throw std::invalid_argument("rate gate spacing must be >= 0");
}

// A call exactly window_duration_ old has expired.
size_t RateGate::first_live(TimePoint now) const {
    size_t i = 0;
    while (i < call_timestamps_.size() && now - call_timestamps_[i] >= window_duration_) ++i;
    return i;
}

size_t RateGate::calls_in_window(TimePoint now) const {
    return call_timestamps_.size() - first_live(now);
}

bool RateGate::try_acquire(TimePoint now) const {
    if (calls_in_window(now) >= window_capacity_) return false;
    if (has_last_call_ && now - last_call_ < min_spacing_) return false;
    return true;
}

void RateGate::record_call(TimePoint now) {
    prune(now);
    call_timestamps_.push_back(now);
    has_last_call_ = true;
    last_call_ = now;
}

TimePoint RateGate::next_allowed(TimePoint now) const {
    TimePoint at = now;
    if (has_last_call_) at = std::max(at, last_call_ + min_spacing_);

    size_t live = first_live(now);
    size_t in_window = call_timestamps_.size() - live;
    if (in_window >= window_capacity_) {
        // the window frees a slot once enough of the oldest calls expire
        size_t must_expire = in_window - window_capacity_;
        at = std::max(at, call_timestamps_[live + must_expire] + window_duration_);
    }
    return at;
}

void RateGate::prune(TimePoint now) {
    size_t n = first_live(now);
    call_timestamps_.erase(call_timestamps_.begin(), call_timestamps_.begin() + static_cast<std::ptrdiff_t>(n));
}

} // namespace cmdgate
