#pragma once
#include "include/cmdgate.hpp"
#include <unordered_map>

namespace cmdgate {

enum class DebounceAction : uint8_t {
    enqueue,   // new entry, append to its tier
    replace,   // supersede `existing` in place
    reuse      // a poll is already pending, hand back `existing`
};

struct DebounceDecision {
    DebounceAction action = DebounceAction::enqueue;
    EnvelopePtr existing;
};

// DebounceIndex: tracks the single pending (not yet in-flight) envelope per
// device, plus the single pending poll. Not synchronized.
class DebounceIndex {
public:
    // Records `env` as the pending entry for its key and tells the caller
    // what to do with the queue. On `reuse` the index is unchanged.
    DebounceDecision offer(const EnvelopePtr& env);

    // Forget `env` once it leaves the pending state. No-op if a newer
    // envelope already owns the key.
    void release(const EnvelopePtr& env);

    bool has_pending(const DeviceId& target) const;
    bool has_pending_poll() const { return pending_poll_ != nullptr; }
    size_t size() const { return pending_commands_.size() + (pending_poll_ ? 1 : 0); }

private:
    std::unordered_map<DeviceId, EnvelopePtr> pending_commands_;
    EnvelopePtr pending_poll_;
};

} // namespace cmdgate
