#include "time_utils.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace microbatch_server::time_utils {

auto
format_timestamp(const std::chrono::system_clock::time_point& time_point)
    -> std::string
{
  constexpr int kMillisecondsPerSecond = 1000;
  const auto milliseconds =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          time_point.time_since_epoch()) %
      kMillisecondsPerSecond;

  const std::time_t time = std::chrono::system_clock::to_time_t(time_point);
  std::tm local_tm{};
  localtime_r(&time, &local_tm);
  std::ostringstream oss;
  oss << std::put_time(&local_tm, "%H:%M:%S") << '.' << std::setfill('0')
      << std::setw(3) << milliseconds.count();
  return oss.str();
}

auto
elapsed_seconds_rounded(
    SteadyClock::time_point start, SteadyClock::time_point end) -> double
{
  constexpr double kScale = 10000.0;
  if (end <= start) {
    return 0.0;
  }
  const double seconds = std::chrono::duration<double>(end - start).count();
  return std::round(seconds * kScale) / kScale;
}

auto
elapsed_ms(SteadyClock::time_point start, SteadyClock::time_point end)
    -> double
{
  if (end <= start) {
    return 0.0;
  }
  return std::chrono::duration<double, std::milli>(end - start).count();
}

}  // namespace microbatch_server::time_utils
