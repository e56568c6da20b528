#pragma once
#include "include/cmdgate.hpp"
#include "config.hpp"
#include "debounce_index.hpp"
#include "priority_queue.hpp"
#include "rate_gate.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace cmdgate {

enum class DispatchStatus : uint8_t {
    idle,        // nothing queued
    throttled,   // head is waiting for the gate until retry_at
    dispatched   // one envelope went to the remote client and was resolved
};

struct DispatchStep {
    DispatchStatus status = DispatchStatus::idle;
    TimePoint retry_at{};
    EnvelopePtr envelope;
};

struct DispatcherStats {
    uint64_t dispatched = 0;
    uint64_t commands = 0;
    uint64_t polls = 0;
    uint64_t superseded = 0;
    uint64_t poll_reuses = 0;
    uint64_t failures = 0;
    uint64_t timeouts = 0;
    uint64_t shutdowns = 0;
};

// Dispatcher: the only path to the remote client. Many threads may enqueue;
// exactly one context dispatches, either the worker thread started by
// start() or a caller driving run_once() by hand. Never both.
class Dispatcher {
public:
    using NowFn = std::function<TimePoint()>;

    Dispatcher(RemoteClient& client, const Config& cfg, NowFn now = &Clock::now);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    void start();
    // Joins the worker after its current call, then resolves every pending
    // envelope with ErrorKind::shutdown.
    void stop();

    std::future<CommandResult> enqueue_command(const DeviceId& device_id, DeviceValue value);
    std::shared_future<PollResult> enqueue_poll();

    // One scheduling step at `now`. The remote call runs on the caller's
    // thread with the lock released.
    DispatchStep run_once(TimePoint now);

    // Pending or in flight.
    bool has_outstanding_command(const DeviceId& device_id) const;

    size_t pending() const;
    DispatcherStats stats() const;

private:
    void loop();
    void execute(const EnvelopePtr& env);

    RemoteClient& client_;
    NowFn now_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    RateGate gate_;
    DebounceIndex index_;
    PriorityQueue queue_;
    std::unordered_map<DeviceId, size_t> inflight_commands_;
    uint64_t next_seq_ = 0;
    bool stopped_ = false;
    DispatcherStats stats_;

    std::thread th_;
    std::atomic<bool> running_{false};
};

} // namespace cmdgate
