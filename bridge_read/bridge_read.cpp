#include <chrono>
#include <iostream>

#include "clock.hpp"
#include "shared_defaults.hpp"
#include "shared_state_bridge.hpp"

// Entry point: prints the rest timer as another local process sees it.
int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "Usage: ./wsync_bridge_read <shared_dir>\n";
        return 1;
    }

    SystemClock clock;
    SharedDefaults defaults(argv[1]);
    SharedStateBridge bridge(defaults, clock);

    const TimerSnapshot timer = bridge.load();
    std::cout << "state=" << timer_state_name(timer.state) << " total=" << timer.total_duration << "s";
    if (timer.end) {
        const auto left = std::chrono::duration_cast<std::chrono::seconds>(*timer.end - clock.now());
        std::cout << " remaining=" << (left.count() > 0 ? left.count() : 0) << "s";
    }
    std::cout << "\n";
    return 0;
}
