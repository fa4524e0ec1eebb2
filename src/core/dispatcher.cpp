#include "dispatcher.hpp"

#include <algorithm>
#include <format>
#include <future>
#include <utility>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"
#include "utils/time_utils.hpp"

namespace microbatch_server {

Dispatcher::Dispatcher(
    RequestRouter& router, PendingRequestTable& pending,
    DispatcherSettings settings, VerbosityLevel verbosity)
    : router_(router), pending_(pending), settings_(settings),
      verbosity_(verbosity)
{
  if (settings_.request_timeout <= std::chrono::milliseconds::zero() ||
      settings_.poll_interval <= std::chrono::milliseconds::zero()) {
    throw InvalidConfigException(
        "Dispatcher timeout and poll interval must be positive");
  }
}

void
Dispatcher::shutdown()
{
  if (!shutdown_.exchange(true, std::memory_order_acq_rel)) {
    log_info(verbosity_, "Dispatcher shutting down");
  }
}

auto
Dispatcher::submit(std::string payload) -> ClassificationResponse
{
  if (is_shutdown()) {
    throw ServiceUnavailableException("Dispatcher is shut down");
  }

  const auto started = clock::now();
  const RequestId request_id = ids_.next();
  auto future = pending_.register_request(request_id);

  ClassificationRequest request;
  request.id = request_id;
  request.payload = std::move(payload);
  request.enqueued_at = started;
  if (!router_.route(std::move(request))) {
    pending_.abandon(request_id);
    throw ServiceUnavailableException("Worker pool is not accepting requests");
  }
  log_trace(verbosity_, std::format("Request {} enqueued", request_id));

  const auto deadline = started + settings_.request_timeout;
  for (auto now = clock::now(); now < deadline; now = clock::now()) {
    const auto slice = std::min<clock::duration>(
        settings_.poll_interval, deadline - now);
    if (future.wait_for(slice) == std::future_status::ready) {
      return complete(future.get(), started);
    }
    if (is_shutdown()) {
      if (!pending_.abandon(request_id)) {
        return complete(future.get(), started);
      }
      throw ServiceUnavailableException("Dispatcher is shutting down");
    }
  }

  // A worker that already claimed the handle is about to fulfill it.
  if (!pending_.abandon(request_id)) {
    return complete(future.get(), started);
  }

  record_timeout();
  log_warning(std::format(
      "Request {} timed out after {} ms", request_id,
      settings_.request_timeout.count()));
  throw RequestTimeoutException("Request timeout");
}

auto
Dispatcher::complete(
    ClassificationResponse response, clock::time_point started)
    -> ClassificationResponse
{
  const double latency_ms = time_utils::elapsed_ms(started, clock::now());
  record_request(latency_ms);
  log_trace(
      verbosity_,
      std::format(
          "Request {} answered by worker {} in {:.3f} ms", response.id,
          response.worker_id, latency_ms));
  return response;
}

}  // namespace microbatch_server
