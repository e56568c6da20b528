#pragma once
#include "include/cmdgate.hpp"
#include "device_entity.hpp"
#include "dispatcher.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace cmdgate {

// Poller: enqueues one poll per interval and fans the status map out to the
// registered entities. A failed cycle keeps the previous snapshot.
class Poller {
public:
    Poller(Dispatcher& dispatcher, Duration interval);
    ~Poller();

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    // Entities must outlive the poller.
    void add_entity(DeviceEntity& entity);

    // The first cycle runs one interval after start(); call refresh() first
    // for an immediate initial snapshot.
    void start();
    void stop();

    // Enqueue one poll, block until the dispatcher resolves it, then fan the
    // result out. The dispatcher must be running (start(), or run_once()
    // driven from another thread); otherwise this never returns.
    PollResult refresh();

    bool last_update_success() const;
    StatusMap snapshot() const;
    uint64_t cycles() const { return cycles_.load(); }
    uint64_t failed_cycles() const { return failed_cycles_.load(); }

private:
    void loop();
    PollResult wait_for_result(const std::shared_future<PollResult>& fut, bool interruptible);
    void publish(const PollResult& result);

    Dispatcher& dispatcher_;
    const Duration interval_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<DeviceEntity*> entities_;
    StatusMap snapshot_;
    bool last_success_ = false;

    std::atomic<uint64_t> cycles_{0};
    std::atomic<uint64_t> failed_cycles_{0};
    std::thread th_;
    std::atomic<bool> running_{false};
};

} // namespace cmdgate
