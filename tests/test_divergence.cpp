#include <iostream>

#include "xor_race.h"

// A race can cancel out by chance, so divergence of the unsync counter is only reported, never asserted.
// The atomic counter must be 0 on every run: each operand is applied an even number of times.
int main() {
    size_t const runs_count = 5;
    xr::race_config_t const config;
    size_t diverged = 0;

    for (size_t i = 0; i < runs_count; ++i) {
        xr::race_result_t const result = xr::run_race(config);
        if (result.atomic_value != 0) {
            std::cerr << "run " << i << ": atomic counter lost an update: " << xr::to_binary_string(result.atomic_value) << std::endl;
            return 1;
        }
        if (result.unsync_value != result.atomic_value) ++diverged;
        std::cout << "run " << i << ": unsync " << xr::to_binary_string(result.unsync_value) <<
            "  took " << xr::format_duration(result.took) << std::endl;
    }

    std::cout << "unsync diverged from atomic in " << diverged << " of " << runs_count << " runs" << std::endl;
    return 0;
}
