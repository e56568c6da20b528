#include "priority_queue.hpp"
#include <algorithm>

namespace cmdgate {

std::deque<EnvelopePtr>& PriorityQueue::tier(RequestKind kind) {
    return kind == RequestKind::command ? commands_ : polls_;
}

void PriorityQueue::enqueue(EnvelopePtr env) {
    auto& q = env->priority == Priority::command ? commands_ : polls_;
    // submissions arrive in order under the dispatcher lock, so push_back
    // keeps the tier sorted by (submitted_at, seq)
    q.push_back(std::move(env));
}

EnvelopePtr PriorityQueue::next_ready() const {
    if (!commands_.empty()) return commands_.front();
    if (!polls_.empty()) return polls_.front();
    return nullptr;
}

EnvelopePtr PriorityQueue::pop() {
    EnvelopePtr out;
    if (!commands_.empty()) {
        out = commands_.front();
        commands_.pop_front();
    } else if (!polls_.empty()) {
        out = polls_.front();
        polls_.pop_front();
    }
    return out;
}

bool PriorityQueue::replace(const EnvelopePtr& old, const EnvelopePtr& fresh) {
    if (old->kind != fresh->kind) return false;
    auto& q = tier(old->kind);
    auto it = std::find(q.begin(), q.end(), old);
    if (it == q.end()) return false;
    fresh->submitted_at = old->submitted_at;
    fresh->seq = old->seq;
    *it = fresh;
    return true;
}

std::vector<EnvelopePtr> PriorityQueue::drain() {
    std::vector<EnvelopePtr> out;
    out.reserve(size());
    for (auto& e : commands_) out.push_back(e);
    for (auto& e : polls_) out.push_back(e);
    commands_.clear();
    polls_.clear();
    return out;
}

size_t PriorityQueue::size(RequestKind kind) const {
    return kind == RequestKind::command ? commands_.size() : polls_.size();
}

} // namespace cmdgate
