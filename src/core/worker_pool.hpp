#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "classification_request.hpp"
#include "cpu_affinity.hpp"
#include "predictor.hpp"
#include "request_queue.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"
#include "worker.hpp"

namespace microbatch_server {

inline constexpr const char* kPoolStoppedMessage = "Worker pool stopped";

struct WorkerStatus {
  int id = 0;
  std::optional<unsigned> core;
  bool pinned = false;
  WorkerState state = WorkerState::Stopped;
  int restarts = 0;
  bool retired = false;
};

// =============================================================================
// WorkerPool
// -----------------------------------------------------------------------------
// Owns N workers and their request queue(s). With shared routing every worker
// drains one queue; with round-robin routing each worker has its own queue and
// requests rotate over them. A supervisor thread restarts failed workers up to
// the configured cap and reports stalled heartbeats.
// =============================================================================
class WorkerPool : public RequestRouter {
 public:
  WorkerPool(
      PoolSettings settings, BatchingSettings batching,
      PredictorFactory predictor_factory, ResponseSink* sink,
      VerbosityLevel verbosity = VerbosityLevel::Info);
  ~WorkerPool() override;

  void start();
  // Idempotent. Requests still queued are answered with kPoolStoppedMessage.
  void stop();

  [[nodiscard]] auto route(ClassificationRequest request) -> bool override;

  // One supervision pass; the supervisor thread calls it periodically.
  void check_workers();

  [[nodiscard]] auto is_running() const -> bool
  {
    return running_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto worker_count() const -> std::size_t
  {
    return workers_.size();
  }
  [[nodiscard]] auto alive_count() const -> std::size_t;
  [[nodiscard]] auto status() const -> std::vector<WorkerStatus>;
  [[nodiscard]] auto routing() const -> RoutingPolicy
  {
    return settings_.routing;
  }
  [[nodiscard]] auto queue_count() const -> std::size_t
  {
    return queues_.size();
  }
  [[nodiscard]] auto queue_size(std::size_t index) const -> std::size_t;

 private:
  void supervise(const std::stop_token& stop);
  void retire_worker(Worker& worker);
  void answer_stopped(RequestQueue& queue, const std::string& message);
  [[nodiscard]] auto select_queue() -> RequestQueue*;

  PoolSettings settings_;
  BatchingSettings batching_;
  PredictorFactory predictor_factory_;
  ResponseSink* sink_;
  VerbosityLevel verbosity_;

  CpuTopology topology_;
  std::vector<std::unique_ptr<RequestQueue>> queues_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::vector<bool> stall_reported_;
  std::atomic<std::size_t> next_queue_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};

  std::mutex supervise_mutex_;
  std::size_t last_alive_ = 0;
  std::mutex supervisor_cv_mutex_;
  std::condition_variable_any supervisor_cv_;
  std::jthread supervisor_;
};

}  // namespace microbatch_server
