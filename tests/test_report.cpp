#include <iostream>
#include <sstream>
#include <string>
#include <chrono>

#include "xor_race.h"

static int failed = 0;

static void expect_eq(std::string const& got, std::string const& expected, const char *what) {
    bool const ok = (got == expected);
    std::cout << (ok ? "  ok   " : "  FAIL ") << what << std::endl;
    if (!ok) { std::cerr << what << ": expected \"" << expected << "\", got \"" << got << "\"" << std::endl; ++failed; }
}

int main() {
    using namespace std::chrono;
    std::cout << "to_binary_string / format_duration / print_race_result:" << std::endl;

    expect_eq(xr::to_binary_string(0), std::string(64, '0'), "0 is 64 zeros");
    expect_eq(xr::to_binary_string(4), std::string(61, '0') + "100", "4 is zero padded");
    expect_eq(xr::to_binary_string(~uint64_t(0)), std::string(64, '1'), "max is 64 ones");
    expect_eq(xr::to_binary_string(uint64_t(1) << 63), "1" + std::string(63, '0'), "msb first");

    expect_eq(xr::format_duration(nanoseconds(0)), "0ns", "0ns");
    expect_eq(xr::format_duration(nanoseconds(999)), "999ns", "below 1us stays in ns");
    expect_eq(xr::format_duration(microseconds(850)), "850\xC2\xB5s", "850us");
    expect_eq(xr::format_duration(nanoseconds(1499)), "1\xC2\xB5s", "1.499us rounds down");
    expect_eq(xr::format_duration(milliseconds(5)), "5ms", "5ms");
    expect_eq(xr::format_duration(microseconds(1500)), "2ms", "1.5ms rounds half up");
    expect_eq(xr::format_duration(milliseconds(1499)), "1s", "1.499s rounds down");
    expect_eq(xr::format_duration(seconds(2)), "2s", "2s");
    expect_eq(xr::format_duration(seconds(-1)), "0ns", "negative clamps to 0");

    xr::race_result_t result;
    result.unsync_value = 5;
    result.atomic_value = 0;
    result.took = milliseconds(42);
    result.active_workers_at_read = 0;
    std::ostringstream out;
    xr::print_race_result(out, result);
    expect_eq(out.str(),
        "unsync: " + std::string(61, '0') + "101\n"
        "atomic: " + std::string(64, '0') + "\n"
        "took 42ms\n", "three result lines");

    std::cout << (failed ? "FAILED" : "passed") << std::endl;
    return failed ? 1 : 0;
}
