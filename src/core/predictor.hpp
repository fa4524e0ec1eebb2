#pragma once

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "classification_request.hpp"

namespace microbatch_server {

// =============================================================================
// Predictor
// -----------------------------------------------------------------------------
// Batched text classifier. predict() returns exactly one Prediction per input,
// in input order, or throws for the whole batch. Implementations are owned by
// a single worker and are never called concurrently.
// =============================================================================
class Predictor {
 public:
  Predictor() = default;
  Predictor(const Predictor&) = delete;
  auto operator=(const Predictor&) -> Predictor& = delete;
  Predictor(Predictor&&) = delete;
  auto operator=(Predictor&&) -> Predictor& = delete;
  virtual ~Predictor() = default;

  [[nodiscard]] virtual auto predict(std::span<const std::string> texts)
      -> std::vector<Prediction> = 0;
};

// Builds the predictor of one worker; called on the worker's own thread.
using PredictorFactory =
    std::function<std::unique_ptr<Predictor>(int worker_id)>;

}  // namespace microbatch_server
