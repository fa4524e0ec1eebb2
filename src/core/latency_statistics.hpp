#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <numeric>
#include <optional>
#include <span>
#include <vector>

namespace microbatch_server {

inline constexpr double kPercentileP99 = 99.0;
inline constexpr double kPercentileP95 = 95.0;
inline constexpr double kPercentileP50 = 50.0;

struct LatencyStatistics {
  std::size_t count;
  double min;
  double p50;
  double p95;
  double p99;
  double max;
  double mean;
};

// Percentiles use linear interpolation between closest ranks.
template <typename Sample, typename Projection = std::identity>
[[nodiscard]] inline auto
compute_latency_statistics(
    std::span<const Sample> samples,
    Projection projection = Projection{}) -> std::optional<LatencyStatistics>
{
  if (samples.empty()) {
    return std::nullopt;
  }

  const std::size_t size = samples.size();
  std::vector<double> sorted;
  sorted.reserve(size);
  for (const auto& sample : samples) {
    sorted.push_back(static_cast<double>(std::invoke(projection, sample)));
  }
  std::ranges::sort(sorted);

  const auto percentile_value = [&](double percentile) -> double {
    if (percentile <= 0.0) {
      return sorted.front();
    }
    if (percentile >= 100.0) {
      return sorted.back();
    }

    const double position =
        (percentile / 100.0) * static_cast<double>(size - 1U);
    const auto lower_index = static_cast<std::size_t>(std::floor(position));
    const auto upper_index = static_cast<std::size_t>(std::ceil(position));
    if (lower_index == upper_index) {
      return sorted[lower_index];
    }

    const double fraction = position - static_cast<double>(lower_index);
    return std::lerp(sorted[lower_index], sorted[upper_index], fraction);
  };

  const double sum = std::accumulate(sorted.begin(), sorted.end(), 0.0);

  return LatencyStatistics{
      .count = size,
      .min = sorted.front(),
      .p50 = percentile_value(kPercentileP50),
      .p95 = percentile_value(kPercentileP95),
      .p99 = percentile_value(kPercentileP99),
      .max = sorted.back(),
      .mean = sum / static_cast<double>(size),
  };
}

[[nodiscard]] inline auto
compute_latency_statistics(const std::vector<double>& latencies)
    -> std::optional<LatencyStatistics>
{
  return compute_latency_statistics(
      std::span<const double>(latencies), std::identity{});
}

}  // namespace microbatch_server
