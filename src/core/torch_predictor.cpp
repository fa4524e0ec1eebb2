#include "torch_predictor.hpp"

#include <ATen/Parallel.h>
#include <c10/core/InferenceMode.h>
#include <c10/util/Exception.h>
#include <torch/torch.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <format>
#include <memory>
#include <utility>

#include "utils/exceptions.hpp"
#include "utils/logger.hpp"

namespace microbatch_server {

namespace {
auto
load_module(const std::string& model_path) -> torch::jit::script::Module
{
  try {
    auto module = torch::jit::load(model_path);
    module.eval();
    return module;
  }
  catch (const c10::Error& e) {
    throw ModelLoadingException(
        std::format("Failed to load model '{}': {}", model_path, e.what()));
  }
}

auto
label_for(const std::vector<std::string>& labels, std::int64_t index)
    -> const std::string&
{
  if (index < 0 || static_cast<std::size_t>(index) >= labels.size()) {
    return labels.front();
  }
  return labels[static_cast<std::size_t>(index)];
}
}  // namespace

TorchScriptPredictor::TorchScriptPredictor(const ModelSettings& settings)
    : TorchScriptPredictor(load_module(settings.path), settings.labels)
{
}

TorchScriptPredictor::TorchScriptPredictor(
    torch::jit::script::Module module, std::vector<std::string> labels)
    : module_(std::move(module)), labels_(std::move(labels))
{
  if (labels_.empty()) {
    throw ModelLoadingException("Predictor requires at least one label");
  }
}

auto
TorchScriptPredictor::predict(std::span<const std::string> texts)
    -> std::vector<Prediction>
{
  if (texts.empty()) {
    return {};
  }

  const c10::InferenceMode guard;
  try {
    c10::List<std::string> batch;
    batch.reserve(texts.size());
    for (const auto& text : texts) {
      batch.push_back(text);
    }

    const auto output = module_.forward({batch});
    if (!output.isTensor()) {
      throw InferenceExecutionException(
          "Model output is not a tensor of logits");
    }
    return predictions_from_logits(output.toTensor(), labels_, texts.size());
  }
  catch (const InferenceExecutionException&) {
    throw;
  }
  catch (const c10::Error& e) {
    throw InferenceExecutionException(
        std::format("Inference failed: {}", e.what_without_backtrace()));
  }
  catch (const std::exception& e) {
    throw InferenceExecutionException(
        std::format("Inference failed: {}", e.what()));
  }
}

auto
TorchScriptPredictor::predictions_from_logits(
    const at::Tensor& logits, const std::vector<std::string>& labels,
    std::size_t expected_rows) -> std::vector<Prediction>
{
  if (logits.dim() != 2) {
    throw InferenceExecutionException(std::format(
        "Expected 2-D logits, got a tensor of rank {}", logits.dim()));
  }
  const auto rows = static_cast<std::size_t>(logits.size(0));
  const auto cols = static_cast<std::size_t>(logits.size(1));
  if (rows != expected_rows) {
    throw InferenceExecutionException(std::format(
        "Model returned {} rows for a batch of {}", rows, expected_rows));
  }
  if (cols != labels.size()) {
    throw InferenceExecutionException(std::format(
        "Model returned {} classes but {} labels are configured", cols,
        labels.size()));
  }

  const auto probabilities =
      torch::softmax(logits.to(torch::kCPU, torch::kDouble), 1).contiguous();
  const auto accessor = probabilities.accessor<double, 2>();

  std::vector<Prediction> predictions;
  predictions.reserve(rows);
  for (std::size_t row = 0; row < rows; ++row) {
    Prediction prediction;
    prediction.probabilities.reserve(cols);
    std::int64_t best = 0;
    for (std::size_t col = 0; col < cols; ++col) {
      const double value = accessor[static_cast<std::int64_t>(row)]
                                   [static_cast<std::int64_t>(col)];
      prediction.probabilities.push_back(value);
      if (value > prediction.probabilities[static_cast<std::size_t>(best)]) {
        best = static_cast<std::int64_t>(col);
      }
    }
    prediction.class_index = static_cast<int>(best);
    prediction.confidence =
        prediction.probabilities[static_cast<std::size_t>(best)];
    prediction.label = label_for(labels, best);
    predictions.push_back(std::move(prediction));
  }
  return predictions;
}

void
configure_torch_threads(int intra_op_threads)
{
  at::set_num_threads(intra_op_threads);
}

auto
make_torch_predictor_factory(ModelSettings settings) -> PredictorFactory
{
  return [settings = std::move(settings)](
             int /*worker_id*/) -> std::unique_ptr<Predictor> {
    return std::make_unique<TorchScriptPredictor>(settings);
  };
}

}  // namespace microbatch_server
