#pragma once

#include <cstddef>
#include <future>
#include <mutex>
#include <unordered_map>

#include "classification_request.hpp"
#include "utils/logger.hpp"

namespace microbatch_server {

// =============================================================================
// PendingRequestTable
// -----------------------------------------------------------------------------
// Correlates responses with the dispatcher call waiting for them. Each request
// id owns a single-slot completion handle; the worker that answers the request
// fulfills it directly. Responses for ids nobody waits for (abandoned after a
// timeout) are dropped and counted.
// =============================================================================
class PendingRequestTable : public ResponseSink {
 public:
  explicit PendingRequestTable(
      VerbosityLevel verbosity = VerbosityLevel::Info)
      : verbosity_(verbosity)
  {
  }

  // Throws DuplicateRequestIdException when a handle already exists for id.
  [[nodiscard]] auto register_request(RequestId request_id)
      -> std::future<ClassificationResponse>;

  auto publish(ClassificationResponse response) -> bool override;

  // Removes the handle for id. Returns false when the handle was already
  // claimed by a publisher (or never existed).
  auto abandon(RequestId request_id) -> bool;

  [[nodiscard]] auto size() const -> std::size_t;
  [[nodiscard]] auto dropped_count() const -> std::size_t;

 private:
  VerbosityLevel verbosity_;
  mutable std::mutex mutex_;
  std::unordered_map<RequestId, std::promise<ClassificationResponse>> pending_;
  std::size_t dropped_ = 0;
};

}  // namespace microbatch_server
