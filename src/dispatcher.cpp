#include "dispatcher.hpp"
#include <exception>
#include <iostream>

namespace cmdgate {

Dispatcher::Dispatcher(RemoteClient& client, const Config& cfg, NowFn now)
    : client_(client),
      now_(std::move(now)),
      gate_(cfg.rate_window_capacity, cfg.rate_window_duration, cfg.min_request_spacing)
{
    validate_config(cfg);
    if (!now_) now_ = &Clock::now;
}

Dispatcher::~Dispatcher() {
    stop();
}

void Dispatcher::start() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (running_.exchange(true)) return;
        stopped_ = false;
        th_ = std::thread(&Dispatcher::loop, this);
    }
    std::cout << "[Dispatcher] STARTED capacity=" << gate_.window_capacity() << "\n";
}

void Dispatcher::stop() {
    std::vector<EnvelopePtr> abandoned;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (stopped_) return;
        stopped_ = true;
        running_.store(false);
    }
    cv_.notify_all();
    if (th_.joinable()) th_.join();

    {
        std::lock_guard<std::mutex> lk(mtx_);
        abandoned = queue_.drain();
        for (auto& env : abandoned) index_.release(env);
        stats_.shutdowns += abandoned.size();
    }
    for (auto& env : abandoned) env->fail(ErrorKind::shutdown, "dispatcher stopped");
    std::cout << "[Dispatcher] STOPPED abandoned=" << abandoned.size() << "\n";
}

std::future<CommandResult> Dispatcher::enqueue_command(const DeviceId& device_id, DeviceValue value) {
    std::future<CommandResult> fut;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto env = RequestEnvelope::make_command(device_id, value, now_(), ++next_seq_);
        fut = env->command_done.get_future();
        if (stopped_) {
            ++stats_.shutdowns;
            env->fail(ErrorKind::shutdown, "dispatcher stopped");
            return fut;
        }

        DebounceDecision d = index_.offer(env);
        if (d.action == DebounceAction::replace && queue_.replace(d.existing, env)) {
            d.existing->fail(ErrorKind::superseded, "superseded by value=" + std::to_string(value));
            ++stats_.superseded;
            std::cout << "[Dispatcher] COMMAND_SUPERSEDED device=" << device_id
                      << " old=" << d.existing->payload << " new=" << value << "\n";
        } else {
            queue_.enqueue(env);
            std::cout << "[Dispatcher] COMMAND_QUEUED device=" << device_id << " value=" << value
                      << " pending=" << queue_.size() << "\n";
        }
    }
    cv_.notify_one();
    return fut;
}

std::shared_future<PollResult> Dispatcher::enqueue_poll() {
    std::shared_future<PollResult> fut;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        auto env = RequestEnvelope::make_poll(now_(), ++next_seq_);
        if (stopped_) {
            ++stats_.shutdowns;
            env->fail(ErrorKind::shutdown, "dispatcher stopped");
            return env->poll_shared;
        }

        DebounceDecision d = index_.offer(env);
        if (d.action == DebounceAction::reuse) {
            ++stats_.poll_reuses;
            return d.existing->poll_shared;
        }
        queue_.enqueue(env);
        fut = env->poll_shared;
    }
    cv_.notify_one();
    return fut;
}

DispatchStep Dispatcher::run_once(TimePoint now) {
    DispatchStep step;
    EnvelopePtr env;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        env = queue_.next_ready();
        if (!env) {
            step.retry_at = now;
            return step;
        }
        if (!gate_.try_acquire(now)) {
            step.status = DispatchStatus::throttled;
            step.retry_at = gate_.next_allowed(now);
            return step;
        }
        queue_.pop();
        gate_.record_call(now);
        index_.release(env);
        env->state = EnvelopeState::in_flight;
        if (env->kind == RequestKind::command) ++inflight_commands_[env->target];
        ++stats_.dispatched;
    }

    execute(env);

    step.status = DispatchStatus::dispatched;
    step.retry_at = now;
    step.envelope = env;
    return step;
}

void Dispatcher::execute(const EnvelopePtr& env) {
    if (env->kind == RequestKind::command) {
        CommandResult r;
        try {
            r = client_.set_device_value(env->target, env->payload);
        } catch (const std::exception& e) {
            r = CommandResult::failure(ErrorKind::remote_failure, e.what());
        } catch (...) {
            r = CommandResult::failure(ErrorKind::remote_failure, "unknown exception from remote client");
        }
        {
            std::lock_guard<std::mutex> lk(mtx_);
            ++stats_.commands;
            if (r.error == ErrorKind::remote_timeout) ++stats_.timeouts;
            else if (!r.ok()) ++stats_.failures;
            auto it = inflight_commands_.find(env->target);
            if (it != inflight_commands_.end() && --it->second == 0) inflight_commands_.erase(it);
        }
        if (r.ok()) {
            std::cout << "[Dispatcher] COMMAND_DONE device=" << env->target << " value=" << r.value << "\n";
        } else {
            std::cerr << "[Dispatcher] COMMAND_FAILED device=" << env->target << " error=" << to_string(r.error)
                      << " detail=" << r.detail << "\n";
        }
        env->resolve(std::move(r));
        return;
    }

    PollResult r;
    try {
        r = client_.get_devices_status();
    } catch (const std::exception& e) {
        r = PollResult::failure(ErrorKind::remote_failure, e.what());
    } catch (...) {
        r = PollResult::failure(ErrorKind::remote_failure, "unknown exception from remote client");
    }
    {
        std::lock_guard<std::mutex> lk(mtx_);
        ++stats_.polls;
        if (r.error == ErrorKind::remote_timeout) ++stats_.timeouts;
        else if (!r.ok()) ++stats_.failures;
    }
    if (r.ok()) {
        std::cout << "[Dispatcher] POLL_DONE devices=" << r.value.size() << "\n";
    } else {
        std::cerr << "[Dispatcher] POLL_FAILED error=" << to_string(r.error) << " detail=" << r.detail << "\n";
    }
    env->resolve(std::move(r));
}

void Dispatcher::loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return !queue_.empty() || !running_.load(); });
            if (!running_.load()) return;
        }

        DispatchStep step = run_once(now_());
        if (step.status == DispatchStatus::throttled) {
            // re-peek after waking: a command may have overtaken the head
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait_until(lk, step.retry_at, [&]{ return !running_.load(); });
        }
    }
}

bool Dispatcher::has_outstanding_command(const DeviceId& device_id) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return index_.has_pending(device_id) || inflight_commands_.count(device_id) > 0;
}

size_t Dispatcher::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return queue_.size();
}

DispatcherStats Dispatcher::stats() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
}

} // namespace cmdgate
