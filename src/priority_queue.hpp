#pragma once
#include "include/cmdgate.hpp"
#include <deque>
#include <vector>

namespace cmdgate {

// PriorityQueue: command tier strictly ahead of poll tier, FIFO inside a
// tier. Holds envelopes only while they are pending. Not synchronized.
class PriorityQueue {
public:
    void enqueue(EnvelopePtr env);

    // Head of the highest non-empty tier, or nullptr. Does not pop.
    EnvelopePtr next_ready() const;
    EnvelopePtr pop();

    // Put `fresh` into the slot held by `old`; `fresh` takes over the old
    // submission time and sequence number. False if `old` is not queued.
    bool replace(const EnvelopePtr& old, const EnvelopePtr& fresh);

    // Remove and return everything, commands first.
    std::vector<EnvelopePtr> drain();

    bool empty() const { return commands_.empty() && polls_.empty(); }
    size_t size() const { return commands_.size() + polls_.size(); }
    size_t size(RequestKind kind) const;

private:
    std::deque<EnvelopePtr>& tier(RequestKind kind);

    std::deque<EnvelopePtr> commands_;
    std::deque<EnvelopePtr> polls_;
};

} // namespace cmdgate
