#pragma once
#include "include/cmdgate.hpp"
#include "dispatcher.hpp"
#include <mutex>
#include <optional>

namespace cmdgate {

// DeviceEntity: a controllable device as the UI sees it. Shows the
// requested value immediately and lets polled truth replace it once no
// command for the device is outstanding.
class DeviceEntity {
public:
    DeviceEntity(Dispatcher& dispatcher, DeviceId device_id);

    // Optimistically display `value`, then queue the command.
    std::future<CommandResult> request(DeviceValue value);
    std::future<CommandResult> turn_on(DeviceValue level = 100) { return request(level); }
    std::future<CommandResult> turn_off() { return request(0); }

    void apply_poll(const StatusMap& statuses);

    const DeviceId& device_id() const { return device_id_; }
    std::optional<DeviceValue> displayed_value() const;
    std::optional<DeviceValue> last_polled_value() const;
    bool is_on() const;
    // Seen in the most recent poll fanned out to this entity.
    bool available() const;

private:
    Dispatcher& dispatcher_;
    const DeviceId device_id_;

    mutable std::mutex mtx_;
    std::optional<DeviceValue> displayed_;
    std::optional<DeviceValue> last_polled_;
    bool available_ = false;
};

} // namespace cmdgate
