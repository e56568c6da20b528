#include "reconcile.hpp"

namespace cmdgate {

std::optional<DeviceValue> reconcile(std::optional<DeviceValue> displayed,
                                     std::optional<DeviceValue> polled,
                                     bool has_outstanding_command) {
    if (has_outstanding_command) return displayed;
    if (!polled) return displayed;
    return polled;
}

} // namespace cmdgate
