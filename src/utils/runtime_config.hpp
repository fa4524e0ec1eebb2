#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "logger.hpp"

namespace microbatch_server {
// =============================================================================
// Compile-time defaults
// =============================================================================
inline constexpr int kDefaultWorkerCount = 2;
inline constexpr int kMaxWorkerCount = 64;
inline constexpr int kDefaultMaxBatchSize = 32;
inline constexpr int kMaxBatchSizeLimit = 1024;
inline constexpr int kDefaultMaxBatchDelayMs = 100;
inline constexpr int kDefaultWorkerPollIntervalMs = 10;
inline constexpr int kDefaultRequestTimeoutMs = 30000;
inline constexpr int kDefaultDispatcherPollIntervalMs = 100;
inline constexpr int kDefaultHealthCheckIntervalMs = 500;
inline constexpr int kDefaultWorkerStallTimeoutMs = 10000;
inline constexpr int kDefaultMaxWorkerRestarts = 3;
inline constexpr int kDefaultMetricsPort = 9090;
inline constexpr int kDefaultHttpPort = 5000;
inline constexpr int kDefaultHttpThreadCount = 16;
inline constexpr std::size_t kBytesPerKiB = 1024ULL;
inline constexpr std::size_t kBytesPerMiB = kBytesPerKiB * 1024ULL;
inline constexpr std::size_t kDefaultMaxMessageBytes = 4ULL * kBytesPerMiB;

enum class RoutingPolicy : std::uint8_t { Shared, RoundRobin };

inline auto
default_labels() -> std::vector<std::string>
{
  return {"none", "product", "series"};
}

// =============================================================================
// BatchingSettings
// -----------------------------------------------------------------------------
// Flush policy of a worker's batching loop.
// =============================================================================
struct BatchingSettings {
  int max_batch_size = kDefaultMaxBatchSize;
  std::chrono::milliseconds max_batch_delay{kDefaultMaxBatchDelayMs};
  std::chrono::milliseconds poll_interval{kDefaultWorkerPollIntervalMs};
};

// =============================================================================
// PoolSettings
// -----------------------------------------------------------------------------
// Worker count, CPU pinning, routing and supervision.
// =============================================================================
struct PoolSettings {
  int worker_count = kDefaultWorkerCount;
  RoutingPolicy routing = RoutingPolicy::Shared;
  bool pin_workers = true;
  std::vector<int> core_ids;
  std::chrono::milliseconds health_check_interval{
      kDefaultHealthCheckIntervalMs};
  std::chrono::milliseconds stall_timeout{kDefaultWorkerStallTimeoutMs};
  int max_restarts = kDefaultMaxWorkerRestarts;
};

struct DispatcherSettings {
  std::chrono::milliseconds request_timeout{kDefaultRequestTimeoutMs};
  std::chrono::milliseconds poll_interval{kDefaultDispatcherPollIntervalMs};
};

// HTTP front end; port 0 leaves it disabled.
struct HttpSettings {
  std::string host = "0.0.0.0";
  int port = kDefaultHttpPort;
  int threads = kDefaultHttpThreadCount;
};

struct ModelSettings {
  std::string path;
  std::vector<std::string> labels = default_labels();
  int intra_op_threads = 1;
};

// =============================================================================
// RuntimeConfig
// -----------------------------------------------------------------------------
// Global configuration of the classification server, loaded from YAML.
// =============================================================================
struct RuntimeConfig {
  std::string name;
  std::string config_path;
  std::string server_address = "0.0.0.0:50051";
  int metrics_port = kDefaultMetricsPort;
  std::size_t max_message_bytes = kDefaultMaxMessageBytes;

  VerbosityLevel verbosity = VerbosityLevel::Info;
  ModelSettings model{};
  BatchingSettings batching{};
  PoolSettings pool{};
  DispatcherSettings dispatcher{};
  HttpSettings http{};
  bool valid = true;
};

inline auto
routing_policy_name(RoutingPolicy policy) -> const char*
{
  switch (policy) {
    case RoutingPolicy::RoundRobin:
      return "round_robin";
    case RoutingPolicy::Shared:
    default:
      return "shared";
  }
}

}  // namespace microbatch_server
