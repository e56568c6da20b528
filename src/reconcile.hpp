#pragma once
#include "include/cmdgate.hpp"
#include <optional>

namespace cmdgate {

// Value an entity should display after a poll. A poll never overrides a
// value while a command for the device is still pending or in flight.
// `polled` is empty when the device was missing from the poll.
std::optional<DeviceValue> reconcile(std::optional<DeviceValue> displayed,
                                     std::optional<DeviceValue> polled,
                                     bool has_outstanding_command);

} // namespace cmdgate
