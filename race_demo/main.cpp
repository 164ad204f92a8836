#include <iostream>

#include "xor_race.h"

// 32 threads race on two counters; each random operand is applied 2048 times (an even number),
// so a correct counter must end at 0. The unsync counter usually does not.
int main() {
    xr::race_config_t const config;     // threads = 32, operands per thread = 256, repeats = 2048

    xr::race_result_t const result = xr::run_race(config);
    xr::print_race_result(std::cout, result);

    return 0;
}
