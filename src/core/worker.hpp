#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

#include "batching_loop.hpp"
#include "cpu_affinity.hpp"
#include "predictor.hpp"
#include "request_queue.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace microbatch_server {

enum class WorkerState : std::uint8_t { Starting, Running, Stopped, Failed };

auto worker_state_name(WorkerState state) -> const char*;

struct WorkerContext {
  int id = 0;
  std::optional<unsigned> core;
  RequestQueue* queue = nullptr;
  ResponseSink* sink = nullptr;
  PredictorFactory predictor_factory;
  BatchingSettings batching{};
  const CpuTopology* topology = nullptr;
  VerbosityLevel verbosity = VerbosityLevel::Info;
};

// =============================================================================
// Worker
// -----------------------------------------------------------------------------
// One long-lived thread: pins itself, builds its own predictor, then runs a
// batching loop until stopped. A thread that ends on an exception leaves the
// worker in the Failed state for the pool supervisor to restart.
// =============================================================================
class Worker {
 public:
  using clock = std::chrono::steady_clock;

  explicit Worker(WorkerContext context);
  ~Worker();
  Worker(const Worker&) = delete;
  auto operator=(const Worker&) -> Worker& = delete;
  Worker(Worker&&) = delete;
  auto operator=(Worker&&) -> Worker& = delete;

  void start();
  void request_stop();
  void join();
  void stop();

  // Joins the finished thread and starts a new one with a fresh predictor.
  void restart();

  [[nodiscard]] auto id() const -> int { return context_.id; }
  [[nodiscard]] auto core() const -> std::optional<unsigned>
  {
    return context_.core;
  }
  [[nodiscard]] auto queue() const -> RequestQueue* { return context_.queue; }
  [[nodiscard]] auto state() const -> WorkerState
  {
    return state_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto is_alive() const -> bool;
  [[nodiscard]] auto pinned() const -> bool
  {
    return pinned_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto restart_count() const -> int
  {
    return restarts_.load(std::memory_order_acquire);
  }
  [[nodiscard]] auto heartbeat_age(clock::time_point now) const
      -> clock::duration;
  [[nodiscard]] auto last_error() const -> std::string;

  // A retired worker exhausted its restarts and no longer takes requests.
  void retire() { retired_.store(true, std::memory_order_release); }
  [[nodiscard]] auto retired() const -> bool
  {
    return retired_.load(std::memory_order_acquire);
  }

 private:
  void thread_main(const std::stop_token& stop);
  void pin_to_core();
  void touch_heartbeat();

  WorkerContext context_;
  std::jthread thread_;
  std::atomic<WorkerState> state_{WorkerState::Stopped};
  std::atomic<std::int64_t> heartbeat_{0};
  std::atomic<int> restarts_{0};
  std::atomic<bool> pinned_{false};
  std::atomic<bool> retired_{false};
  mutable std::mutex error_mutex_;
  std::string last_error_;
};

}  // namespace microbatch_server
