#include "simulated_remote.hpp"
#include <stdexcept>
#include <thread>

namespace cmdgate {

SimulatedRemoteClient::SimulatedRemoteClient(NowFn now) : now_(std::move(now)) {
    if (!now_) now_ = &Clock::now;
}

void SimulatedRemoteClient::set_device(const DeviceId& id, DeviceValue value) {
    std::lock_guard<std::mutex> lk(mtx_);
    devices_[id] = value;
}

void SimulatedRemoteClient::set_latency(Duration latency) {
    std::lock_guard<std::mutex> lk(mtx_);
    latency_ = latency;
}

void SimulatedRemoteClient::fail_next(RequestKind kind, ErrorKind error, const std::string& detail) {
    std::lock_guard<std::mutex> lk(mtx_);
    script_.push_back({kind, false, error, detail});
}

void SimulatedRemoteClient::throw_next(RequestKind kind, const std::string& what) {
    std::lock_guard<std::mutex> lk(mtx_);
    script_.push_back({kind, true, ErrorKind::remote_failure, what});
}

void SimulatedRemoteClient::on_call(CallHook hook) {
    std::lock_guard<std::mutex> lk(mtx_);
    hook_ = std::move(hook);
}

void SimulatedRemoteClient::begin_call(RequestKind kind, const DeviceId& device, DeviceValue value) {
    CallRecord rec{kind, device, value, now_()};
    CallHook hook;
    Duration latency;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        calls_.push_back(rec);
        hook = hook_;
        latency = latency_;
    }
    if (hook) hook(rec);
    if (latency > Duration::zero()) std::this_thread::sleep_for(latency);
}

bool SimulatedRemoteClient::take_script(RequestKind kind, Scripted& out) {
    std::lock_guard<std::mutex> lk(mtx_);
    for (auto it = script_.begin(); it != script_.end(); ++it) {
        if (it->kind == kind) {
            out = *it;
            script_.erase(it);
            return true;
        }
    }
    return false;
}

CommandResult SimulatedRemoteClient::set_device_value(const DeviceId& device_id, DeviceValue value) {
    begin_call(RequestKind::command, device_id, value);

    Scripted s;
    if (take_script(RequestKind::command, s)) {
        if (s.raise) throw std::runtime_error(s.detail);
        return CommandResult::failure(s.error, s.detail);
    }

    std::lock_guard<std::mutex> lk(mtx_);
    auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return CommandResult::failure(ErrorKind::remote_failure, "unknown device " + device_id);
    }
    it->second = value;
    return CommandResult::success(value);
}

PollResult SimulatedRemoteClient::get_devices_status() {
    begin_call(RequestKind::poll, DeviceId(), 0);

    Scripted s;
    if (take_script(RequestKind::poll, s)) {
        if (s.raise) throw std::runtime_error(s.detail);
        return PollResult::failure(s.error, s.detail);
    }

    std::lock_guard<std::mutex> lk(mtx_);
    return PollResult::success(devices_);
}

std::vector<CallRecord> SimulatedRemoteClient::calls() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return calls_;
}

StatusMap SimulatedRemoteClient::devices() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return devices_;
}

} // namespace cmdgate
