#include "debounce_index.hpp"

namespace cmdgate {

DebounceDecision DebounceIndex::offer(const EnvelopePtr& env) {
    DebounceDecision d;
    if (env->kind == RequestKind::poll) {
        if (pending_poll_) {
            d.action = DebounceAction::reuse;
            d.existing = pending_poll_;
            return d;
        }
        pending_poll_ = env;
        return d;
    }

    auto it = pending_commands_.find(env->target);
    if (it != pending_commands_.end() && it->second->state == EnvelopeState::pending) {
        d.action = DebounceAction::replace;
        d.existing = it->second;
        it->second = env;
        return d;
    }
    pending_commands_[env->target] = env;
    return d;
}

void DebounceIndex::release(const EnvelopePtr& env) {
    if (env->kind == RequestKind::poll) {
        if (pending_poll_ == env) pending_poll_.reset();
        return;
    }
    auto it = pending_commands_.find(env->target);
    if (it != pending_commands_.end() && it->second == env) pending_commands_.erase(it);
}

bool DebounceIndex::has_pending(const DeviceId& target) const {
    return pending_commands_.find(target) != pending_commands_.end();
}

} // namespace cmdgate
