#include "poller.hpp"
#include <iostream>
#include <stdexcept>

using namespace std::chrono_literals;

namespace cmdgate {

Poller::Poller(Dispatcher& dispatcher, Duration interval)
    : dispatcher_(dispatcher), interval_(interval)
{
    if (interval_ <= Duration::zero()) throw std::invalid_argument("poll interval must be > 0");
}

Poller::~Poller() {
    stop();
}

void Poller::add_entity(DeviceEntity& entity) {
    std::lock_guard<std::mutex> lk(mtx_);
    entities_.push_back(&entity);
}

void Poller::start() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (running_.exchange(true)) return;
    th_ = std::thread(&Poller::loop, this);
}

void Poller::stop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_.store(false);
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();
}

PollResult Poller::refresh() {
    PollResult r = wait_for_result(dispatcher_.enqueue_poll(), false);
    publish(r);
    return r;
}

PollResult Poller::wait_for_result(const std::shared_future<PollResult>& fut, bool interruptible) {
    if (!interruptible) return fut.get();
    // the poll may sit behind the rate gate for a while; keep stop() responsive
    while (fut.wait_for(50ms) != std::future_status::ready) {
        if (!running_.load()) return PollResult::failure(ErrorKind::shutdown, "poller stopped");
    }
    return fut.get();
}

void Poller::publish(const PollResult& result) {
    ++cycles_;
    std::vector<DeviceEntity*> targets;
    StatusMap statuses;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        last_success_ = result.ok();
        if (!result.ok()) {
            ++failed_cycles_;
            std::cerr << "[Poller] POLL_FAILED error=" << to_string(result.error) << " detail=" << result.detail
                      << " keeping=" << snapshot_.size() << "\n";
            return;
        }
        snapshot_ = result.value;
        statuses = snapshot_;
        targets = entities_;
    }

    for (auto* e : targets) e->apply_poll(statuses);
    std::cout << "[Poller] POLL_APPLIED devices=" << statuses.size() << " entities=" << targets.size() << "\n";
}

void Poller::loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_for(lk, interval_, [&]{ return !running_.load(); });
            if (!running_.load()) return;
        }

        PollResult r = wait_for_result(dispatcher_.enqueue_poll(), true);
        if (r.error == ErrorKind::shutdown && !running_.load()) return;
        publish(r);
    }
}

bool Poller::last_update_success() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_success_;
}

StatusMap Poller::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return snapshot_;
}

} // namespace cmdgate
