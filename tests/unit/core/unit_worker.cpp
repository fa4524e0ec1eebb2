#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "core/worker.hpp"
#include "test_helpers.hpp"
#include "utils/exceptions.hpp"

using namespace microbatch_server;
using namespace std::chrono_literals;

namespace {

class WorkerTest : public ::testing::Test {
 protected:
  auto make_context(PredictorFactory factory) -> WorkerContext
  {
    WorkerContext context;
    context.id = 2;
    context.queue = &queue_;
    context.sink = &sink_;
    context.predictor_factory = std::move(factory);
    context.batching.max_batch_size = 4;
    context.batching.max_batch_delay = 5ms;
    context.batching.poll_interval = 2ms;
    context.verbosity = VerbosityLevel::Silent;
    return context;
  }

  void push(RequestId id, const std::string& text)
  {
    ClassificationRequest request;
    request.id = id;
    request.payload = text;
    request.enqueued_at = std::chrono::steady_clock::now();
    ASSERT_TRUE(queue_.push(std::move(request)));
  }

  std::shared_ptr<FakePredictorState> state_ =
      std::make_shared<FakePredictorState>();
  RequestQueue queue_;
  RecordingSink sink_;
};

}  // namespace

TEST_F(WorkerTest, RequiresQueueSinkAndFactory)
{
  WorkerContext context = make_context(make_fake_factory(state_));
  context.predictor_factory = nullptr;
  EXPECT_THROW(Worker{context}, InvalidConfigException);
}

TEST_F(WorkerTest, ServesRequestsUntilStopped)
{
  Worker worker(make_context(make_fake_factory(state_)));
  EXPECT_EQ(worker.state(), WorkerState::Stopped);
  worker.start();
  ASSERT_TRUE(wait_until(
      [&worker] { return worker.state() == WorkerState::Running; }));
  EXPECT_TRUE(worker.is_alive());
  EXPECT_FALSE(worker.pinned());

  push(1, "one");
  push(2, "two");
  ASSERT_TRUE(wait_until([this] { return sink_.count() == 2; }));
  for (const auto& response : sink_.responses()) {
    EXPECT_TRUE(response.ok());
    EXPECT_EQ(response.worker_id, 2);
  }
  EXPECT_LT(worker.heartbeat_age(std::chrono::steady_clock::now()), 1s);

  worker.stop();
  EXPECT_EQ(worker.state(), WorkerState::Stopped);
  EXPECT_FALSE(worker.is_alive());
}

TEST_F(WorkerTest, StartTwiceThrows)
{
  Worker worker(make_context(make_fake_factory(state_)));
  worker.start();
  EXPECT_THROW(worker.start(), InvalidConfigException);
  worker.stop();
}

TEST_F(WorkerTest, PredictorConstructionFailureMarksWorkerFailed)
{
  Worker worker(make_context([](int /*worker_id*/) -> std::unique_ptr<Predictor> {
    throw ModelLoadingException("weights missing");
  }));
  worker.start();
  ASSERT_TRUE(wait_until(
      [&worker] { return worker.state() == WorkerState::Failed; }));
  EXPECT_FALSE(worker.is_alive());
  EXPECT_EQ(worker.last_error(), "weights missing");
  worker.join();
}

TEST_F(WorkerTest, NullPredictorMarksWorkerFailed)
{
  Worker worker(make_context(
      [](int /*worker_id*/) -> std::unique_ptr<Predictor> { return nullptr; }));
  worker.start();
  ASSERT_TRUE(wait_until(
      [&worker] { return worker.state() == WorkerState::Failed; }));
  EXPECT_NE(worker.last_error().find("returned nothing"), std::string::npos);
  worker.join();
}

TEST_F(WorkerTest, RestartBuildsAFreshPredictor)
{
  int attempts = 0;
  auto state = state_;
  Worker worker(make_context(
      [&attempts, state](int /*worker_id*/) -> std::unique_ptr<Predictor> {
        if (++attempts == 1) {
          throw ModelLoadingException("first attempt fails");
        }
        return std::make_unique<FakePredictor>(state);
      }));
  worker.start();
  ASSERT_TRUE(wait_until(
      [&worker] { return worker.state() == WorkerState::Failed; }));

  worker.restart();
  ASSERT_TRUE(wait_until(
      [&worker] { return worker.state() == WorkerState::Running; }));
  EXPECT_EQ(worker.restart_count(), 1);
  EXPECT_EQ(attempts, 2);

  push(5, "after restart");
  ASSERT_TRUE(wait_until([this] { return sink_.count() == 1; }));
  EXPECT_TRUE(sink_.responses().front().ok());
  worker.stop();
}

TEST(WorkerStateName, NamesEveryState)
{
  EXPECT_STREQ(worker_state_name(WorkerState::Starting), "starting");
  EXPECT_STREQ(worker_state_name(WorkerState::Running), "running");
  EXPECT_STREQ(worker_state_name(WorkerState::Stopped), "stopped");
  EXPECT_STREQ(worker_state_name(WorkerState::Failed), "failed");
}
