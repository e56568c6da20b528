#include "rate_gate.hpp"
#include <cassert>
#include <iostream>
#include <stdexcept>

using namespace cmdgate;
using namespace std::chrono_literals;

int main() {
    const TimePoint t0 = TimePoint{} + 1h;

    // spacing alone
    {
        RateGate gate(30, 60s, 2s);
        assert(gate.try_acquire(t0));
        gate.record_call(t0);
        assert(!gate.try_acquire(t0));
        assert(!gate.try_acquire(t0 + 1999ms));
        assert(gate.try_acquire(t0 + 2s));
        assert(gate.next_allowed(t0 + 500ms) == t0 + 2s);
        // check does not record
        assert(gate.try_acquire(t0 + 2s));
        assert(gate.calls_in_window(t0 + 2s) == 1);
    }

    // window capacity, a call exactly one window old has expired
    {
        RateGate gate(3, 10s, 0s);
        gate.record_call(t0);
        gate.record_call(t0 + 1s);
        gate.record_call(t0 + 2s);
        assert(!gate.try_acquire(t0 + 3s));
        assert(gate.next_allowed(t0 + 3s) == t0 + 10s);
        assert(!gate.try_acquire(t0 + 10s - 1ms));
        assert(gate.try_acquire(t0 + 10s));
        assert(gate.calls_in_window(t0 + 10s) == 2);
        gate.record_call(t0 + 10s);
        assert(!gate.try_acquire(t0 + 10s));
        assert(gate.next_allowed(t0 + 10s) == t0 + 11s);
    }

    // both limits: the later of the two wins
    {
        RateGate gate(2, 10s, 4s);
        gate.record_call(t0);
        gate.record_call(t0 + 9s);
        assert(gate.next_allowed(t0 + 9s) == t0 + 13s);
        assert(!gate.try_acquire(t0 + 12s));
        assert(gate.try_acquire(t0 + 13s));
    }

    // no call yet: allowed right away
    {
        RateGate gate(1, 1s, 5s);
        assert(gate.try_acquire(t0));
        assert(gate.next_allowed(t0) == t0);
    }

    bool threw = false;
    try {
        RateGate bad(0, 60s, 2s);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "RateGate test PASSED\n";
    return 0;
}
