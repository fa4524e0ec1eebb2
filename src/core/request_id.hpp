#pragma once

#include <atomic>
#include <chrono>
#include <functional>

#include "classification_request.hpp"

namespace microbatch_server {

// =============================================================================
// RequestIdGenerator
// -----------------------------------------------------------------------------
// Correlation ids derived from a monotonic microsecond clock. Ids are strictly
// increasing: a request issued within the same tick as the previous one gets
// previous + 1 instead of a duplicate.
// =============================================================================
class RequestIdGenerator {
 public:
  using ClockSource = std::function<std::chrono::microseconds()>;

  RequestIdGenerator();
  explicit RequestIdGenerator(ClockSource clock);

  [[nodiscard]] auto next() -> RequestId;

 private:
  ClockSource clock_;
  std::atomic<RequestId> last_{0};
};

}  // namespace microbatch_server
