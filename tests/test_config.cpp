#include "config.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace cmdgate;
using namespace std::chrono_literals;

static bool rejects(const Config& cfg) {
    try {
        validate_config(cfg);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

int main() {
    Config defaults;
    assert(defaults.rate_window_capacity == 30);
    assert(defaults.rate_window_duration == 60s);
    assert(defaults.min_request_spacing == 2s);
    assert(defaults.poll_interval == 5s);
    assert(!rejects(defaults));
    assert(describe(defaults) == "capacity=30 window_ms=60000 spacing_ms=2000 poll_ms=5000");

    {
        const char* argv[] = {"cmdgate", "--capacity=10", "--spacing-ms=0", "--poll-ms=250", "--run-ms=900"};
        Config cfg;
        long long run_ms = 0;
        std::string err;
        assert(apply_config_args(5, argv, cfg, run_ms, err));
        assert(cfg.rate_window_capacity == 10);
        assert(cfg.min_request_spacing == Duration::zero());
        assert(cfg.poll_interval == 250ms);
        assert(cfg.rate_window_duration == 60s);
        assert(run_ms == 900);
        assert(!rejects(cfg));
    }

    {
        const char* argv[] = {"cmdgate", "--delay=3"};
        Config cfg;
        long long run_ms = 0;
        std::string err;
        assert(!apply_config_args(2, argv, cfg, run_ms, err));
        assert(err == "unknown option --delay");
    }

    {
        const char* argv[] = {"cmdgate", "--spacing-ms=-5"};
        Config cfg;
        long long run_ms = 0;
        std::string err;
        assert(!apply_config_args(2, argv, cfg, run_ms, err));
        assert(err == "bad number for --spacing-ms");
    }

    {
        // millisecond counts that cannot be held as a nanosecond Duration
        const char* window[] = {"cmdgate", "--window-ms=9223372036854775"};
        const char* spacing[] = {"cmdgate", "--spacing-ms=9300000000000"};
        Config cfg;
        long long run_ms = 0;
        std::string err;
        assert(!apply_config_args(2, window, cfg, run_ms, err));
        assert(err == "bad number for --window-ms");
        assert(!apply_config_args(2, spacing, cfg, run_ms, err));
        assert(err == "bad number for --spacing-ms");
        assert(cfg.rate_window_duration == 60s);
        assert(cfg.min_request_spacing == 2s);

        const char* day[] = {"cmdgate", "--poll-ms=86400000"};
        assert(apply_config_args(2, day, cfg, run_ms, err));
        assert(cfg.poll_interval == 24h);
    }

    {
        const char* argv[] = {"cmdgate", "capacity"};
        Config cfg;
        long long run_ms = 0;
        std::string err;
        assert(!apply_config_args(2, argv, cfg, run_ms, err));
    }

    Config bad = defaults;
    bad.rate_window_capacity = 0;
    assert(rejects(bad));
    bad = defaults;
    bad.rate_window_duration = Duration::zero();
    assert(rejects(bad));
    bad = defaults;
    bad.min_request_spacing = -1ms;
    assert(rejects(bad));
    bad = defaults;
    bad.poll_interval = Duration::zero();
    assert(rejects(bad));

    std::cout << "Config test PASSED\n";
    return 0;
}
