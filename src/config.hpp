#pragma once
#include "include/cmdgate.hpp"
#include <string>

namespace cmdgate {

struct Config {
    size_t rate_window_capacity = 30;
    Duration rate_window_duration = std::chrono::seconds(60);
    Duration min_request_spacing = std::chrono::seconds(2);
    Duration poll_interval = std::chrono::seconds(5);
};

// Throws std::invalid_argument describing the first bad field.
void validate_config(const Config& cfg);

// Apply --capacity=N --window-ms=N --spacing-ms=N --poll-ms=N overrides.
// `run_ms` receives --run-ms=N when present (demo run length).
// Returns false and fills `error` on an unknown flag or a bad number.
bool apply_config_args(int argc, const char* const* argv, Config& cfg, long long& run_ms, std::string& error);

std::string describe(const Config& cfg);

} // namespace cmdgate
