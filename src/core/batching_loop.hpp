#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <vector>

#include "classification_request.hpp"
#include "predictor.hpp"
#include "request_queue.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace microbatch_server {

enum class FlushReason : std::uint8_t { Full, Timeout, Shutdown };

auto flush_reason_name(FlushReason reason) -> const char*;

// Flush condition of a batch holding `size` requests. The age of the batch
// counts from the previous flush of the same loop.
[[nodiscard]] auto should_flush(
    std::size_t size, std::chrono::steady_clock::time_point last_flush_at,
    std::chrono::steady_clock::time_point now,
    const BatchingSettings& settings) -> std::optional<FlushReason>;

struct BatchingLoopConfig {
  int worker_id = 0;
  RequestQueue* queue = nullptr;
  Predictor* predictor = nullptr;
  ResponseSink* sink = nullptr;
  BatchingSettings settings{};
  VerbosityLevel verbosity = VerbosityLevel::Info;
  // Steady-clock ticks of the last iteration; may be null.
  std::atomic<std::int64_t>* heartbeat = nullptr;
};

// =============================================================================
// BatchingLoop
// -----------------------------------------------------------------------------
// Per-worker accumulation of requests into batches. A batch is flushed when it
// is full or when max_batch_delay has passed since the previous flush (or the
// start of the loop), so an idle worker answers a lone request on its next
// poll. Every request
// that enters a batch gets exactly one response, including on predictor
// failure, where each member receives the failure message.
// =============================================================================
class BatchingLoop {
 public:
  using clock = std::chrono::steady_clock;
  using FlushObserver = std::function<void(FlushReason, std::size_t)>;

  explicit BatchingLoop(const BatchingLoopConfig& config);

  // Runs until stop is requested or the queue is shut down and empty, then
  // flushes what is left.
  void run(std::stop_token stop);

  // One iteration: bounded wait on the queue, then flush check. Returns true
  // when a request was dequeued.
  auto step() -> bool;

  void flush(FlushReason reason);

  [[nodiscard]] auto pending() const -> std::size_t { return batch_.size(); }
  [[nodiscard]] auto flush_count() const -> std::size_t { return flushes_; }

  void set_flush_observer(FlushObserver observer)
  {
    flush_observer_ = std::move(observer);
  }

 private:
  [[nodiscard]] auto next_wait_timeout(clock::time_point now) const
      -> clock::duration;
  void touch_heartbeat() const;
  void publish_failure(const std::string& message);

  BatchingLoopConfig config_;
  std::vector<ClassificationRequest> batch_;
  clock::time_point last_flush_at_{clock::now()};
  std::size_t flushes_ = 0;
  FlushObserver flush_observer_;
};

}  // namespace microbatch_server
