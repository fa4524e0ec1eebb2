#include <gtest/gtest.h>
#include <torch/script.h>
#include <torch/torch.h>

#include <cmath>
#include <numeric>
#include <string>
#include <vector>

#include "core/torch_predictor.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace microbatch_server;

namespace {
const std::vector<std::string> kLabels{"none", "product", "series"};
}  // namespace

TEST(TorchScriptPredictor, SoftmaxRowsSumToOne)
{
  const auto logits =
      torch::tensor({{1.0, 2.0, 3.0}, {0.5, -1.0, 0.0}}, torch::kFloat);
  const auto predictions =
      TorchScriptPredictor::predictions_from_logits(logits, kLabels, 2);
  ASSERT_EQ(predictions.size(), 2U);
  for (const auto& prediction : predictions) {
    ASSERT_EQ(prediction.probabilities.size(), 3U);
    const double total = std::accumulate(
        prediction.probabilities.begin(), prediction.probabilities.end(), 0.0);
    EXPECT_NEAR(total, 1.0, 1e-9);
  }
  EXPECT_EQ(predictions[0].class_index, 2);
  EXPECT_EQ(predictions[0].label, "series");
  EXPECT_EQ(predictions[1].class_index, 0);
  EXPECT_EQ(predictions[1].label, "none");
}

TEST(TorchScriptPredictor, ConfidenceIsProbabilityOfArgmax)
{
  const auto logits = torch::tensor({{0.0, 2.0, 0.0}}, torch::kFloat);
  const auto predictions =
      TorchScriptPredictor::predictions_from_logits(logits, kLabels, 1);
  ASSERT_EQ(predictions.size(), 1U);
  const double expected = std::exp(2.0) / (std::exp(2.0) + 2.0);
  EXPECT_NEAR(predictions[0].confidence, expected, 1e-6);
  EXPECT_DOUBLE_EQ(
      predictions[0].confidence, predictions[0].probabilities[1]);
  EXPECT_EQ(predictions[0].label, "product");
}

TEST(TorchScriptPredictor, ShapeMismatchesThrow)
{
  EXPECT_THROW(
      TorchScriptPredictor::predictions_from_logits(
          torch::zeros({3}), kLabels, 3),
      InferenceExecutionException);
  EXPECT_THROW(
      TorchScriptPredictor::predictions_from_logits(
          torch::zeros({2, 3}), kLabels, 3),
      InferenceExecutionException);
  EXPECT_THROW(
      TorchScriptPredictor::predictions_from_logits(
          torch::zeros({3, 2}), kLabels, 3),
      InferenceExecutionException);
}

TEST(TorchScriptPredictor, PredictsWithScriptedModule)
{
  TorchScriptPredictor predictor(make_length_classifier_model(), kLabels);
  const std::vector<std::string> texts{"abc", "Hello", "a"};
  const auto predictions = predictor.predict(texts);
  ASSERT_EQ(predictions.size(), 3U);
  EXPECT_EQ(predictions[0].class_index, 0);
  EXPECT_EQ(predictions[1].class_index, 2);
  EXPECT_EQ(predictions[1].label, "series");
  EXPECT_EQ(predictions[2].class_index, 1);
  EXPECT_GT(predictions[0].confidence, 0.5);
}

TEST(TorchScriptPredictor, EmptyBatchYieldsNothing)
{
  TorchScriptPredictor predictor(make_length_classifier_model(), kLabels);
  EXPECT_TRUE(predictor.predict({}).empty());
}

TEST(TorchScriptPredictor, WrongClassCountThrows)
{
  TorchScriptPredictor predictor(make_two_column_model(), kLabels);
  const std::vector<std::string> texts{"x"};
  EXPECT_THROW(
      { [[maybe_unused]] auto out = predictor.predict(texts); },
      InferenceExecutionException);
}

TEST(TorchScriptPredictor, ScriptErrorsBecomeInferenceErrors)
{
  TorchScriptPredictor predictor(make_raising_model(), kLabels);
  const std::vector<std::string> texts{"x", "y"};
  try {
    [[maybe_unused]] auto out = predictor.predict(texts);
    FAIL() << "expected InferenceExecutionException";
  }
  catch (const InferenceExecutionException& e) {
    EXPECT_NE(std::string(e.what()).find("tokenizer failure"), std::string::npos)
        << e.what();
  }
}

TEST(TorchScriptPredictor, LoadsSavedModule)
{
  ModelSettings settings;
  settings.path = save_length_classifier_model("predictor_roundtrip.pt").string();
  settings.labels = kLabels;
  TorchScriptPredictor predictor(settings);
  const std::vector<std::string> texts{"Hello"};
  const auto predictions = predictor.predict(texts);
  ASSERT_EQ(predictions.size(), 1U);
  EXPECT_EQ(predictions[0].label, "series");
}

TEST(TorchScriptPredictor, MissingModelThrowsModelLoading)
{
  ModelSettings settings;
  settings.path = "/nonexistent/model.pt";
  EXPECT_THROW(TorchScriptPredictor{settings}, ModelLoadingException);
}

TEST(TorchScriptPredictor, EmptyLabelsRejected)
{
  EXPECT_THROW(
      (TorchScriptPredictor{make_length_classifier_model(), {}}),
      ModelLoadingException);
}

TEST(TorchScriptPredictor, FactoryBuildsIndependentPredictors)
{
  ModelSettings settings;
  settings.path = save_length_classifier_model("predictor_factory.pt").string();
  settings.labels = kLabels;
  const auto factory = make_torch_predictor_factory(settings);
  auto first = factory(0);
  auto second = factory(1);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_NE(first.get(), second.get());
}
