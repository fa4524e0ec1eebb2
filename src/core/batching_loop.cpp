#include "batching_loop.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <span>
#include <string>
#include <utility>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"
#include "utils/time_utils.hpp"

namespace microbatch_server {

auto
flush_reason_name(FlushReason reason) -> const char*
{
  switch (reason) {
    case FlushReason::Full:
      return "full";
    case FlushReason::Timeout:
      return "timeout";
    case FlushReason::Shutdown:
    default:
      return "shutdown";
  }
}

auto
should_flush(
    std::size_t size, std::chrono::steady_clock::time_point last_flush_at,
    std::chrono::steady_clock::time_point now,
    const BatchingSettings& settings) -> std::optional<FlushReason>
{
  if (size == 0) {
    return std::nullopt;
  }
  if (size >= static_cast<std::size_t>(std::max(1, settings.max_batch_size))) {
    return FlushReason::Full;
  }
  if (now - last_flush_at >= settings.max_batch_delay) {
    return FlushReason::Timeout;
  }
  return std::nullopt;
}

BatchingLoop::BatchingLoop(const BatchingLoopConfig& config) : config_(config)
{
  if (config_.queue == nullptr || config_.predictor == nullptr ||
      config_.sink == nullptr) {
    throw InvalidConfigException(
        "BatchingLoop requires a queue, a predictor and a response sink");
  }
  batch_.reserve(
      static_cast<std::size_t>(std::max(1, config_.settings.max_batch_size)));
}

void
BatchingLoop::run(std::stop_token stop)
{
  log_debug(
      config_.verbosity,
      std::format(
          "Worker {} batching loop started on queue '{}'", config_.worker_id,
          config_.queue->name()));

  last_flush_at_ = clock::now();
  while (!stop.stop_requested()) {
    const bool dequeued = step();
    if (!dequeued && config_.queue->is_shutdown() &&
        config_.queue->size() == 0) {
      break;
    }
  }

  if (!batch_.empty()) {
    flush(FlushReason::Shutdown);
  }
  touch_heartbeat();
  log_debug(
      config_.verbosity,
      std::format("Worker {} batching loop stopped", config_.worker_id));
}

auto
BatchingLoop::next_wait_timeout(clock::time_point now) const -> clock::duration
{
  const clock::duration poll = config_.settings.poll_interval;
  if (batch_.empty()) {
    return poll;
  }
  const auto deadline = last_flush_at_ + config_.settings.max_batch_delay;
  if (deadline <= now) {
    return clock::duration::zero();
  }
  return std::min(poll, deadline - now);
}

auto
BatchingLoop::step() -> bool
{
  touch_heartbeat();

  ClassificationRequest request;
  const auto timeout = next_wait_timeout(clock::now());
  const bool dequeued = timeout > clock::duration::zero()
                            ? config_.queue->wait_for_and_pop(request, timeout)
                            : config_.queue->try_pop(request);

  const auto now = clock::now();
  if (dequeued) {
    log_trace(
        config_.verbosity,
        std::format(
            "Worker {} accepted request {} ({} pending)", config_.worker_id,
            request.id, batch_.size() + 1));
    batch_.push_back(std::move(request));
  }

  if (const auto reason =
          should_flush(batch_.size(), last_flush_at_, now, config_.settings);
      reason.has_value()) {
    flush(*reason);
  }
  return dequeued;
}

void
BatchingLoop::flush(FlushReason reason)
{
  if (batch_.empty()) {
    return;
  }

  std::vector<std::string> texts;
  texts.reserve(batch_.size());
  for (const auto& request : batch_) {
    texts.push_back(request.payload);
  }

  const auto started = clock::now();
  std::optional<std::string> failure;
  std::vector<Prediction> predictions;
  try {
    predictions = config_.predictor->predict(std::span<const std::string>(texts));
    if (predictions.size() != batch_.size()) {
      failure = std::format(
          "Predictor returned {} results for a batch of {}",
          predictions.size(), batch_.size());
    }
  }
  catch (const std::exception& e) {
    failure = e.what();
  }
  const double inference_ms = time_utils::elapsed_ms(started, clock::now());

  const auto size = batch_.size();
  record_flush(flush_reason_name(reason), size, inference_ms);
  ++flushes_;

  if (failure.has_value()) {
    log_error(std::format(
        "Worker {}: error processing batch of {}: {}", config_.worker_id, size,
        *failure));
    publish_failure(*failure);
  } else {
    log_stats(
        config_.verbosity,
        std::format(
            "Worker {} flushed {} request(s) ({}) in {:.3f} ms",
            config_.worker_id, size, flush_reason_name(reason), inference_ms));
    for (std::size_t i = 0; i < size; ++i) {
      auto response = ClassificationResponse::success(
          batch_[i].id, std::move(predictions[i]), config_.worker_id);
      if (!config_.sink->publish(std::move(response))) {
        log_trace(
            config_.verbosity,
            std::format(
                "Worker {}: nobody waits for request {}", config_.worker_id,
                batch_[i].id));
      }
    }
  }

  batch_.clear();
  last_flush_at_ = clock::now();
  if (flush_observer_) {
    flush_observer_(reason, size);
  }
}

void
BatchingLoop::publish_failure(const std::string& message)
{
  for (const auto& request : batch_) {
    record_failed_request();
    if (!config_.sink->publish(ClassificationResponse::failure(
            request.id, message, config_.worker_id))) {
      log_trace(
          config_.verbosity,
          std::format(
              "Worker {}: nobody waits for failed request {}",
              config_.worker_id, request.id));
    }
  }
}

void
BatchingLoop::touch_heartbeat() const
{
  if (config_.heartbeat != nullptr) {
    config_.heartbeat->store(
        clock::now().time_since_epoch().count(), std::memory_order_relaxed);
  }
}

}  // namespace microbatch_server
