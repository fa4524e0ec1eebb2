#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace microbatch_server {

using RequestId = std::uint64_t;

// =============================================================================
// Prediction: one predictor output row
// =============================================================================
struct Prediction {
  std::string label;
  int class_index = -1;
  double confidence = 0.0;
  std::vector<double> probabilities;
};

// =============================================================================
// ClassificationRequest: a single text submitted by a dispatcher. Consumed
// by exactly one worker.
// =============================================================================
struct ClassificationRequest {
  RequestId id = 0;
  std::string payload;
  std::chrono::steady_clock::time_point enqueued_at{};
};

// =============================================================================
// ClassificationResponse: produced by a worker for every request that reached
// one of its batches, carrying either a prediction or an error message. The
// pool answers requests no worker will ever take with an unavailable error.
// =============================================================================
struct ClassificationResponse {
  RequestId id = 0;
  std::optional<Prediction> prediction;
  std::optional<std::string> error;
  int worker_id = -1;
  bool unavailable = false;

  [[nodiscard]] auto ok() const -> bool
  {
    return prediction.has_value() && !error.has_value();
  }

  static auto success(RequestId id, Prediction prediction, int worker_id)
      -> ClassificationResponse
  {
    ClassificationResponse response;
    response.id = id;
    response.prediction = std::move(prediction);
    response.worker_id = worker_id;
    return response;
  }

  static auto failure(RequestId id, std::string message, int worker_id)
      -> ClassificationResponse
  {
    ClassificationResponse response;
    response.id = id;
    response.error = std::move(message);
    response.worker_id = worker_id;
    return response;
  }

  static auto refused(RequestId id, std::string message)
      -> ClassificationResponse
  {
    auto response = failure(id, std::move(message), -1);
    response.unavailable = true;
    return response;
  }
};

// =============================================================================
// ResponseSink: where workers publish responses
// =============================================================================
class ResponseSink {
 public:
  ResponseSink() = default;
  ResponseSink(const ResponseSink&) = delete;
  auto operator=(const ResponseSink&) -> ResponseSink& = delete;
  ResponseSink(ResponseSink&&) = delete;
  auto operator=(ResponseSink&&) -> ResponseSink& = delete;
  virtual ~ResponseSink() = default;

  // Returns false when nobody was waiting for the response's id.
  virtual auto publish(ClassificationResponse response) -> bool = 0;
};

// =============================================================================
// RequestRouter: where dispatchers hand requests over to workers
// =============================================================================
class RequestRouter {
 public:
  RequestRouter() = default;
  RequestRouter(const RequestRouter&) = delete;
  auto operator=(const RequestRouter&) -> RequestRouter& = delete;
  RequestRouter(RequestRouter&&) = delete;
  auto operator=(RequestRouter&&) -> RequestRouter& = delete;
  virtual ~RequestRouter() = default;

  [[nodiscard]] virtual auto route(ClassificationRequest request) -> bool = 0;
};

}  // namespace microbatch_server
