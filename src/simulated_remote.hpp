#pragma once
#include "include/cmdgate.hpp"
#include <deque>
#include <functional>
#include <mutex>
#include <vector>

namespace cmdgate {

struct CallRecord {
    RequestKind kind = RequestKind::command;
    DeviceId device;         // empty for polls
    DeviceValue value = 0;
    TimePoint at{};
};

// SimulatedRemoteClient: in-memory stand-in for the device API. Keeps a
// device table, records every call, and plays back scripted failures.
class SimulatedRemoteClient : public RemoteClient {
public:
    using NowFn = std::function<TimePoint()>;
    using CallHook = std::function<void(const CallRecord&)>;

    explicit SimulatedRemoteClient(NowFn now = &Clock::now);

    // Adds or overwrites a device, e.g. a wall switch pressed by hand.
    void set_device(const DeviceId& id, DeviceValue value = 0);

    // Real-time delay applied to every call.
    void set_latency(Duration latency);

    // Scripted outcomes, consumed one per call of the matching kind.
    void fail_next(RequestKind kind, ErrorKind error, const std::string& detail = "scripted");
    void throw_next(RequestKind kind, const std::string& what);

    // Runs inside every call before it completes, without the client lock.
    void on_call(CallHook hook);

    CommandResult set_device_value(const DeviceId& device_id, DeviceValue value) override;
    PollResult get_devices_status() override;

    std::vector<CallRecord> calls() const;
    StatusMap devices() const;

private:
    struct Scripted {
        RequestKind kind;
        bool raise;
        ErrorKind error;
        std::string detail;
    };

    void begin_call(RequestKind kind, const DeviceId& device, DeviceValue value);
    // Removes and returns the first scripted entry for `kind`, if any.
    bool take_script(RequestKind kind, Scripted& out);

    NowFn now_;
    mutable std::mutex mtx_;
    StatusMap devices_;
    Duration latency_{};
    std::deque<Scripted> script_;
    CallHook hook_;
    std::vector<CallRecord> calls_;
};

} // namespace cmdgate
