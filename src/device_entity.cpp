#include "device_entity.hpp"
#include "reconcile.hpp"
#include <iostream>

namespace cmdgate {

DeviceEntity::DeviceEntity(Dispatcher& dispatcher, DeviceId device_id)
    : dispatcher_(dispatcher), device_id_(std::move(device_id)) {}

std::future<CommandResult> DeviceEntity::request(DeviceValue value) {
    // held across the enqueue so a concurrent apply_poll sees either both
    // the new value and the outstanding command or neither
    std::lock_guard<std::mutex> lk(mtx_);
    displayed_ = value;
    return dispatcher_.enqueue_command(device_id_, value);
}

void DeviceEntity::apply_poll(const StatusMap& statuses) {
    std::optional<DeviceValue> polled;
    auto it = statuses.find(device_id_);
    if (it != statuses.end()) polled = it->second;

    std::lock_guard<std::mutex> lk(mtx_);
    bool outstanding = dispatcher_.has_outstanding_command(device_id_);
    available_ = polled.has_value();
    if (polled) last_polled_ = polled;
    auto next = reconcile(displayed_, polled, outstanding);
    if (outstanding && polled && displayed_ && *polled != *displayed_) {
        std::cout << "[Entity] POLL_HELD device=" << device_id_ << " shown=" << *displayed_
                  << " polled=" << *polled << "\n";
    }
    displayed_ = next;
}

std::optional<DeviceValue> DeviceEntity::displayed_value() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return displayed_;
}

std::optional<DeviceValue> DeviceEntity::last_polled_value() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_polled_;
}

bool DeviceEntity::is_on() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return displayed_ && *displayed_ > 0;
}

bool DeviceEntity::available() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return available_;
}

} // namespace cmdgate
