#include "config.hpp"
#include "device_entity.hpp"
#include "dispatcher.hpp"
#include "poller.hpp"
#include "simulated_remote.hpp"
#include "include/cmdgate.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cmdgate;

int main(int argc, char** argv) {
    Config cfg;
    long long run_ms = 12000;
    std::string error;
    if (!apply_config_args(argc, argv, cfg, run_ms, error)) {
        std::cerr << "cmdgate: " << error << "\n"
                  << "usage: cmdgate [--capacity=N] [--window-ms=N] [--spacing-ms=N] [--poll-ms=N] [--run-ms=N]\n";
        return 2;
    }

    SimulatedRemoteClient remote;
    remote.set_device("dimmer-1", 0);
    remote.set_device("dimmer-2", 40);
    remote.set_device("relay-1", 100);
    remote.set_latency(std::chrono::milliseconds(150));

    std::unique_ptr<Dispatcher> dispatcher;
    std::unique_ptr<Poller> poller;
    try {
        dispatcher = std::make_unique<Dispatcher>(remote, cfg);
        poller = std::make_unique<Poller>(*dispatcher, cfg.poll_interval);
    } catch (const std::invalid_argument& e) {
        std::cerr << "cmdgate: invalid configuration: " << e.what() << "\n";
        return 2;
    }
    std::cout << "[main] config " << describe(cfg) << "\n";

    std::vector<std::unique_ptr<DeviceEntity>> entities;
    for (const auto& kv : remote.devices()) {
        entities.push_back(std::make_unique<DeviceEntity>(*dispatcher, kv.first));
        poller->add_entity(*entities.back());
    }

    dispatcher->start();

    // initial snapshot before the timer takes over
    PollResult first = poller->refresh();
    if (!first.ok()) {
        std::cerr << "[main] first refresh failed: " << first.detail << "\n";
    }
    poller->start();

    // a burst on one device collapses to the last value
    auto a = entities[0]->request(100);
    auto b = entities[0]->request(30);
    auto c = entities[2]->turn_off();

    CommandResult ra = a.get();
    std::cout << "[main] dimmer-1 first request: " << to_string(ra.error) << "\n";
    CommandResult rb = b.get();
    std::cout << "[main] dimmer-1 second request: " << (rb.ok() ? "ok" : to_string(rb.error)) << "\n";
    CommandResult rc = c.get();
    std::cout << "[main] relay-1 off: " << (rc.ok() ? "ok" : to_string(rc.error)) << "\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(run_ms));

    poller->stop();
    dispatcher->stop();

    for (const auto& e : entities) {
        auto shown = e->displayed_value();
        std::cout << "[main] " << e->device_id() << " shown=" << (shown ? std::to_string(*shown) : "?")
                  << " on=" << e->is_on() << "\n";
    }
    DispatcherStats st = dispatcher->stats();
    std::cout << "[main] dispatched=" << st.dispatched << " commands=" << st.commands << " polls=" << st.polls
              << " superseded=" << st.superseded << " failures=" << st.failures << " timeouts=" << st.timeouts
              << "\n";
    std::cout << "exiting\n";
    return 0;
}
