#include "include/cmdgate.hpp"

namespace cmdgate {

const char* to_string(RequestKind kind) {
    switch (kind) {
        case RequestKind::command: return "command";
        case RequestKind::poll: return "poll";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::none: return "none";
        case ErrorKind::superseded: return "superseded";
        case ErrorKind::remote_failure: return "remote_failure";
        case ErrorKind::remote_timeout: return "remote_timeout";
        case ErrorKind::shutdown: return "shutdown";
    }
    return "unknown";
}

std::shared_ptr<RequestEnvelope> RequestEnvelope::make_command(DeviceId target, DeviceValue value, TimePoint now, uint64_t seq) {
    auto env = std::make_shared<RequestEnvelope>();
    env->kind = RequestKind::command;
    env->target = std::move(target);
    env->payload = value;
    env->priority = Priority::command;
    env->submitted_at = now;
    env->seq = seq;
    return env;
}

std::shared_ptr<RequestEnvelope> RequestEnvelope::make_poll(TimePoint now, uint64_t seq) {
    auto env = std::make_shared<RequestEnvelope>();
    env->kind = RequestKind::poll;
    env->priority = Priority::poll;
    env->submitted_at = now;
    env->seq = seq;
    // every poller waiting on this envelope shares the one future
    env->poll_shared = env->poll_done.get_future().share();
    return env;
}

bool RequestEnvelope::resolve(CommandResult result) {
    if (state == EnvelopeState::resolved || kind != RequestKind::command) return false;
    state = EnvelopeState::resolved;
    command_done.set_value(std::move(result));
    return true;
}

bool RequestEnvelope::resolve(PollResult result) {
    if (state == EnvelopeState::resolved || kind != RequestKind::poll) return false;
    state = EnvelopeState::resolved;
    poll_done.set_value(std::move(result));
    return true;
}

bool RequestEnvelope::fail(ErrorKind error, const std::string& detail) {
    if (kind == RequestKind::command) {
        return resolve(CommandResult::failure(error, detail));
    }
    return resolve(PollResult::failure(error, detail));
}

} // namespace cmdgate
