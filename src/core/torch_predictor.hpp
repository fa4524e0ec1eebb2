#pragma once

#include <ATen/core/Tensor.h>
#include <torch/script.h>

#include <span>
#include <string>
#include <vector>

#include "predictor.hpp"
#include "utils/runtime_config.hpp"

namespace microbatch_server {

// =============================================================================
// TorchScriptPredictor
// -----------------------------------------------------------------------------
// Wraps a TorchScript module whose forward() takes List[str] and returns
// logits shaped [batch, num_labels]. Tokenization lives inside the module.
// =============================================================================
class TorchScriptPredictor : public Predictor {
 public:
  // Throws ModelLoadingException when the module cannot be loaded.
  explicit TorchScriptPredictor(const ModelSettings& settings);
  TorchScriptPredictor(
      torch::jit::script::Module module, std::vector<std::string> labels);

  [[nodiscard]] auto predict(std::span<const std::string> texts)
      -> std::vector<Prediction> override;

  // Softmax over dim 1, argmax per row; throws InferenceExecutionException on
  // a shape that does not match (expected_rows x labels.size()).
  static auto predictions_from_logits(
      const at::Tensor& logits, const std::vector<std::string>& labels,
      std::size_t expected_rows) -> std::vector<Prediction>;

  [[nodiscard]] auto labels() const -> const std::vector<std::string>&
  {
    return labels_;
  }

 private:
  torch::jit::script::Module module_;
  std::vector<std::string> labels_;
};

// Intra-op parallelism of libtorch; called once before workers start.
void configure_torch_threads(int intra_op_threads);

auto make_torch_predictor_factory(ModelSettings settings) -> PredictorFactory;

}  // namespace microbatch_server
