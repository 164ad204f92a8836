#include <iostream>
#include <chrono>

#include "xor_race.h"

// Unsync counter alone, without the atomic fetch_xor between its updates.
// Threads now run the racy load/store back to back.
int main() {
    auto const unsync = xr::unsound::unsync_counter_t::create();
    xr::race_config_t const config;

    std::chrono::steady_clock::time_point const steady_start = std::chrono::steady_clock::now();
    {
        xr::worker_group_t workers;
        workers.spawn<xr::entropy_operand_source_t>(config, unsync);
    }   // ~worker_group_t() joins
    auto const took = std::chrono::steady_clock::now() - steady_start;

    std::cout << "unsync: " << xr::to_binary_string(unsync.get()) << std::endl;
    std::cout << "took " << xr::format_duration(std::chrono::duration_cast<std::chrono::nanoseconds>(took)) << std::endl;

    return 0;
}
