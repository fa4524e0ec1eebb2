#pragma once

#include <chrono>
#include <string>

namespace microbatch_server::time_utils {

using SteadyClock = std::chrono::steady_clock;

auto format_timestamp(const std::chrono::system_clock::time_point& time_point)
    -> std::string;

// Seconds between two instants, rounded to 4 decimals as reported to clients.
auto elapsed_seconds_rounded(
    SteadyClock::time_point start, SteadyClock::time_point end) -> double;

auto elapsed_ms(SteadyClock::time_point start, SteadyClock::time_point end)
    -> double;

}  // namespace microbatch_server::time_utils
