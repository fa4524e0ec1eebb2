#include "request_id.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace microbatch_server {

namespace {
auto
steady_microseconds() -> std::chrono::microseconds
{
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now().time_since_epoch());
}
}  // namespace

RequestIdGenerator::RequestIdGenerator()
    : RequestIdGenerator(ClockSource(steady_microseconds))
{
}

RequestIdGenerator::RequestIdGenerator(ClockSource clock)
    : clock_(std::move(clock))
{
}

auto
RequestIdGenerator::next() -> RequestId
{
  const auto now = static_cast<RequestId>(std::max<long long>(
      0, static_cast<long long>(clock_().count())));
  RequestId previous = last_.load(std::memory_order_relaxed);
  RequestId candidate = 0;
  do {
    candidate = std::max(now, previous + 1);
  } while (!last_.compare_exchange_weak(
      previous, candidate, std::memory_order_acq_rel,
      std::memory_order_relaxed));
  return candidate;
}

}  // namespace microbatch_server
