#include <gtest/gtest.h>
#include <json/json.h>

#include <chrono>
#include <memory>
#include <sstream>
#include <string>

#include "core/dispatcher.hpp"
#include "core/pending_request_table.hpp"
#include "core/worker_pool.hpp"
#include "http/classify_http_server.hpp"
#include "test_helpers.hpp"

using namespace microbatch_server;
using namespace std::chrono_literals;

namespace {

auto
parse_body(const std::string& body) -> Json::Value
{
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::string errors;
  std::istringstream stream(body);
  EXPECT_TRUE(Json::parseFromStream(builder, stream, &root, &errors))
      << errors;
  return root;
}

class ClassifyHttpReplyTest : public ::testing::Test {
 protected:
  void SetUp() override
  {
    PoolSettings settings;
    settings.worker_count = 1;
    settings.pin_workers = false;
    settings.health_check_interval = 10ms;
    BatchingSettings batching;
    batching.max_batch_size = 8;
    batching.max_batch_delay = 5ms;
    batching.poll_interval = 2ms;
    pool_ = std::make_unique<WorkerPool>(
        settings, batching, make_fake_factory(state_), &pending_,
        VerbosityLevel::Silent);

    DispatcherSettings dispatcher_settings;
    dispatcher_settings.request_timeout = 200ms;
    dispatcher_settings.poll_interval = 10ms;
    dispatcher_ = std::make_unique<Dispatcher>(
        *pool_, pending_, dispatcher_settings, VerbosityLevel::Silent);
    service_ = std::make_unique<ClassifierServiceImpl>(
        *dispatcher_, *pool_, VerbosityLevel::Silent);
  }

  void start_pool()
  {
    pool_->start();
    ASSERT_TRUE(wait_until([this] { return pool_->alive_count() == 1; }));
  }

  void TearDown() override
  {
    dispatcher_->shutdown();
    pool_->stop();
  }

  std::shared_ptr<FakePredictorState> state_ =
      std::make_shared<FakePredictorState>();
  PendingRequestTable pending_{VerbosityLevel::Silent};
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<ClassifierServiceImpl> service_;
};

}  // namespace

TEST_F(ClassifyHttpReplyTest, SuccessCarriesClassificationBody)
{
  start_pool();
  const auto reply = classify_http_reply(*service_, "Hello");
  EXPECT_EQ(reply.status, 200);

  const auto body = parse_body(reply.body);
  EXPECT_EQ(body["class"].asString(), "label_of_Hello");
  EXPECT_EQ(body["sentence"].asString(), "Hello");
  EXPECT_DOUBLE_EQ(body["confidence"].asDouble(), 0.9);
  EXPECT_GE(body["processing_time"].asDouble(), 0.0);
  EXPECT_EQ(body["worker_id"].asInt(), 0);
  EXPECT_FALSE(body.isMember("error"));
}

TEST_F(ClassifyHttpReplyTest, InferenceFailureIs500WithError)
{
  state_->fail = true;
  start_pool();
  const auto reply = classify_http_reply(*service_, "boom");
  EXPECT_EQ(reply.status, 500);
  const auto body = parse_body(reply.body);
  EXPECT_EQ(body["error"].asString(), "model exploded");
  EXPECT_FALSE(body.isMember("class"));
}

TEST_F(ClassifyHttpReplyTest, ExhaustedBudgetIs408RequestTimeout)
{
  state_->delay = 500ms;
  start_pool();
  const auto reply = classify_http_reply(*service_, "slow");
  EXPECT_EQ(reply.status, 408);
  EXPECT_EQ(parse_body(reply.body)["error"].asString(), "Request timeout");
}

TEST_F(ClassifyHttpReplyTest, ShutDownDispatcherIs503)
{
  start_pool();
  dispatcher_->shutdown();
  const auto reply = classify_http_reply(*service_, "late");
  EXPECT_EQ(reply.status, 503);
  EXPECT_TRUE(parse_body(reply.body).isMember("error"));
}

TEST_F(ClassifyHttpReplyTest, ServerStartsOnEphemeralPortAndStops)
{
  ClassifyHttpServer server(
      *service_, HttpServerOptions{
                     .host = "127.0.0.1",
                     .port = 0,
                     .threads = 2,
                     .verbosity = VerbosityLevel::Silent});
  ASSERT_TRUE(server.start());
  EXPECT_GT(server.port(), 0);
  server.stop();
  server.stop();
}

TEST_F(ClassifyHttpReplyTest, StopWithoutStartIsNoop)
{
  ClassifyHttpServer server(*service_, HttpServerOptions{});
  server.stop();
  EXPECT_EQ(server.port(), -1);
}
