#include "config.hpp"
#include <sstream>
#include <stdexcept>

namespace cmdgate {

namespace {

long long ms_of(Duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

bool parse_non_negative(const std::string& text, long long& out) {
    if (text.empty()) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    try {
        out = std::stoll(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

// Largest millisecond count that still fits in Duration with room left for
// adding a spacing or window to a time point.
long long max_duration_ms() {
    return ms_of(Duration::max()) / 2;
}

bool is_duration_key(const std::string& key) {
    return key == "window-ms" || key == "spacing-ms" || key == "poll-ms";
}

} // namespace

void validate_config(const Config& cfg) {
    if (cfg.rate_window_capacity == 0)
        throw std::invalid_argument("rate_window_capacity must be > 0");
    if (cfg.rate_window_duration <= Duration::zero())
        throw std::invalid_argument("rate_window_duration must be > 0");
    if (cfg.min_request_spacing < Duration::zero())
        throw std::invalid_argument("min_request_spacing must be >= 0");
    if (cfg.poll_interval <= Duration::zero())
        throw std::invalid_argument("poll_interval must be > 0");
}

bool apply_config_args(int argc, const char* const* argv, Config& cfg, long long& run_ms, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto eq = arg.find('=');
        if (arg.compare(0, 2, "--") != 0 || eq == std::string::npos) {
            error = "expected --key=value, got '" + arg + "'";
            return false;
        }
        std::string key = arg.substr(2, eq - 2);
        long long n = 0;
        if (!parse_non_negative(arg.substr(eq + 1), n) || (is_duration_key(key) && n > max_duration_ms())) {
            error = "bad number for --" + key;
            return false;
        }

        if (key == "capacity") {
            cfg.rate_window_capacity = static_cast<size_t>(n);
        } else if (key == "window-ms") {
            cfg.rate_window_duration = std::chrono::milliseconds(n);
        } else if (key == "spacing-ms") {
            cfg.min_request_spacing = std::chrono::milliseconds(n);
        } else if (key == "poll-ms") {
            cfg.poll_interval = std::chrono::milliseconds(n);
        } else if (key == "run-ms") {
            run_ms = n;
        } else {
            error = "unknown option --" + key;
            return false;
        }
    }
    return true;
}

std::string describe(const Config& cfg) {
    std::ostringstream os;
    os << "capacity=" << cfg.rate_window_capacity
       << " window_ms=" << ms_of(cfg.rate_window_duration)
       << " spacing_ms=" << ms_of(cfg.min_request_spacing)
       << " poll_ms=" << ms_of(cfg.poll_interval);
    return os.str();
}

} // namespace cmdgate
