#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "classification_request.hpp"
#include "pending_request_table.hpp"
#include "request_id.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace microbatch_server {

// =============================================================================
// Dispatcher
// -----------------------------------------------------------------------------
// Request-facing side of the pool. submit() assigns a fresh id, registers a
// completion handle, routes the request and waits for that handle only, in
// poll-interval slices bounded by the request timeout.
// =============================================================================
class Dispatcher {
 public:
  using clock = std::chrono::steady_clock;

  Dispatcher(
      RequestRouter& router, PendingRequestTable& pending,
      DispatcherSettings settings,
      VerbosityLevel verbosity = VerbosityLevel::Info);

  // Returns the response for this payload (success or carried error).
  // Throws RequestTimeoutException when the budget elapses and
  // ServiceUnavailableException when the pool refuses the request or the
  // dispatcher shuts down while waiting.
  [[nodiscard]] auto submit(std::string payload) -> ClassificationResponse;

  void shutdown();
  [[nodiscard]] auto is_shutdown() const -> bool
  {
    return shutdown_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto settings() const -> const DispatcherSettings&
  {
    return settings_;
  }

 private:
  auto complete(ClassificationResponse response, clock::time_point started)
      -> ClassificationResponse;

  RequestRouter& router_;
  PendingRequestTable& pending_;
  DispatcherSettings settings_;
  VerbosityLevel verbosity_;
  RequestIdGenerator ids_;
  std::atomic<bool> shutdown_{false};
};

}  // namespace microbatch_server
