#include <iostream>
#include <chrono>

#include "xor_race.h"

// atomic counter alone: 32 threads, every operand applied 2048 times - always ends at 0
int main() {
    auto const atomic = xr::atomic_counter_t::create();
    xr::race_config_t const config;

    std::chrono::steady_clock::time_point const steady_start = std::chrono::steady_clock::now();
    {
        xr::worker_group_t workers;
        workers.spawn<xr::entropy_operand_source_t>(config, atomic);
        workers.join_all();
    }
    auto const took = std::chrono::steady_clock::now() - steady_start;

    std::cout << "atomic: " << xr::to_binary_string(atomic.get()) << std::endl;
    std::cout << "took " << xr::format_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(took)) << std::endl;

    return 0;
}
