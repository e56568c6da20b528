#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace cmdgate {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;

using DeviceId = std::string;
using DeviceValue = int;
// deviceId -> value as reported by the remote status call
using StatusMap = std::map<DeviceId, DeviceValue>;

enum class RequestKind : uint8_t {
    command,
    poll
};

// Lower number wins.
enum class Priority : uint8_t {
    command = 0,
    poll = 1
};

enum class ErrorKind : uint8_t {
    none,
    superseded,
    remote_failure,
    remote_timeout,
    shutdown
};

const char* to_string(RequestKind kind);
const char* to_string(ErrorKind kind);

template <typename T>
struct Outcome {
    ErrorKind error = ErrorKind::none;
    std::string detail;
    T value{};

    bool ok() const { return error == ErrorKind::none; }

    static Outcome success(T v) {
        Outcome o;
        o.value = std::move(v);
        return o;
    }
    static Outcome failure(ErrorKind kind, std::string why) {
        Outcome o;
        o.error = kind;
        o.detail = std::move(why);
        return o;
    }
};

// value: the level the remote accepted for the device
using CommandResult = Outcome<DeviceValue>;
using PollResult = Outcome<StatusMap>;

enum class EnvelopeState : uint8_t {
    pending,
    in_flight,
    resolved
};

// RequestEnvelope: one request travelling from enqueue to resolution.
// Only the dispatcher (and the enqueue path, under the dispatcher lock)
// mutates it.
struct RequestEnvelope {
    RequestKind kind = RequestKind::command;
    DeviceId target;             // empty for poll
    DeviceValue payload = 0;     // unused for poll
    Priority priority = Priority::command;
    TimePoint submitted_at{};
    uint64_t seq = 0;
    EnvelopeState state = EnvelopeState::pending;

    std::promise<CommandResult> command_done;
    std::promise<PollResult> poll_done;
    std::shared_future<PollResult> poll_shared;

    static std::shared_ptr<RequestEnvelope> make_command(DeviceId target, DeviceValue value, TimePoint now, uint64_t seq);
    static std::shared_ptr<RequestEnvelope> make_poll(TimePoint now, uint64_t seq);

    // Fulfil the outcome slot. Returns false if it was already resolved
    // or the result does not match the envelope kind.
    bool resolve(CommandResult result);
    bool resolve(PollResult result);
    // Resolve with an error regardless of kind.
    bool fail(ErrorKind error, const std::string& detail);

    bool resolved() const { return state == EnvelopeState::resolved; }
};

using EnvelopePtr = std::shared_ptr<RequestEnvelope>;

// Outbound collaborator. Each call costs one unit of rate budget. Errors are
// reported through the returned outcome or by throwing std::exception.
class RemoteClient {
public:
    virtual ~RemoteClient() = default;
    virtual CommandResult set_device_value(const DeviceId& device_id, DeviceValue value) = 0;
    virtual PollResult get_devices_status() = 0;
};

} // namespace cmdgate
