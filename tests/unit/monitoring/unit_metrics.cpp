#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <prometheus/metric_family.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <vector>

#include "core/request_queue.hpp"
#include "monitoring/metrics.hpp"

using namespace microbatch_server;

namespace {

auto
HasMetric(
    const std::vector<prometheus::MetricFamily>& families,
    std::string_view name) -> bool
{
  return std::ranges::any_of(
      families, [name](const prometheus::MetricFamily& family) {
        return family.name == name;
      });
}

class CountingExposer : public MetricsRegistry::ExposerHandle {
 public:
  CountingExposer(int* registered, int* removed)
      : registered_(registered), removed_(removed)
  {
  }

  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& /*collectable*/) override
  {
    ++*registered_;
  }

  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& /*collectable*/) override
  {
    ++*removed_;
  }

 private:
  int* registered_;
  int* removed_;
};

class MetricsFixture : public ::testing::Test {
 protected:
  void SetUp() override
  {
    shutdown_metrics();
    ASSERT_TRUE(init_metrics(0));
    metrics_ = get_metrics();
    ASSERT_NE(metrics_, nullptr);
  }

  void TearDown() override
  {
    metrics_.reset();
    shutdown_metrics();
  }

  std::shared_ptr<MetricsRegistry> metrics_;
};

}  // namespace

TEST_F(MetricsFixture, RegistersEveryFamily)
{
  ASSERT_NE(metrics_->registry, nullptr);
  // Labelled families only show up once a child exists.
  record_flush("full", 4, 2.0);
  set_queue_size("shared", 0);

  const auto families = metrics_->registry->Collect();
  for (const auto* name :
       {"microbatch_requests_total", "microbatch_timeouts_total",
        "microbatch_failed_requests_total",
        "microbatch_dropped_responses_total",
        "microbatch_worker_restarts_total", "microbatch_request_latency_ms",
        "microbatch_inference_latency_ms", "microbatch_batch_size",
        "microbatch_workers_alive", "microbatch_flushes_total",
        "microbatch_queue_size"}) {
    EXPECT_TRUE(HasMetric(families, name)) << name;
  }
}

TEST_F(MetricsFixture, RecordingHelpersUpdateValues)
{
  record_request(12.5);
  record_request(7.5);
  record_timeout();
  record_failed_request();
  record_failed_request();
  record_dropped_response();
  record_worker_restart();
  set_workers_alive(3);
  record_flush("timeout", 8, 4.0);
  record_flush("timeout", 2, 1.0);

  EXPECT_DOUBLE_EQ(metrics_->requests_total->Value(), 2.0);
  EXPECT_DOUBLE_EQ(metrics_->timeouts_total->Value(), 1.0);
  EXPECT_DOUBLE_EQ(metrics_->failed_requests_total->Value(), 2.0);
  EXPECT_DOUBLE_EQ(metrics_->dropped_responses_total->Value(), 1.0);
  EXPECT_DOUBLE_EQ(metrics_->worker_restarts_total->Value(), 1.0);
  EXPECT_DOUBLE_EQ(metrics_->workers_alive->Value(), 3.0);
  EXPECT_DOUBLE_EQ(metrics_->flush_counter("timeout").Value(), 2.0);
  EXPECT_DOUBLE_EQ(metrics_->flush_counter("full").Value(), 0.0);

  const auto latency = metrics_->request_latency->Collect().histogram;
  EXPECT_EQ(latency.sample_count, 2U);
  EXPECT_DOUBLE_EQ(latency.sample_sum, 20.0);
  const auto sizes = metrics_->batch_size->Collect().histogram;
  EXPECT_EQ(sizes.sample_count, 2U);
  EXPECT_DOUBLE_EQ(sizes.sample_sum, 10.0);
}

TEST_F(MetricsFixture, QueueGaugeTracksEachQueue)
{
  RequestQueue shared{"shared"};
  RequestQueue dedicated{"worker_1"};
  ClassificationRequest request;
  ASSERT_TRUE(shared.push(request));
  ASSERT_TRUE(shared.push(request));
  ASSERT_TRUE(dedicated.push(request));
  EXPECT_DOUBLE_EQ(metrics_->queue_size_gauge("shared").Value(), 2.0);
  EXPECT_DOUBLE_EQ(metrics_->queue_size_gauge("worker_1").Value(), 1.0);

  ClassificationRequest popped;
  ASSERT_TRUE(shared.try_pop(popped));
  EXPECT_DOUBLE_EQ(metrics_->queue_size_gauge("shared").Value(), 1.0);
  [[maybe_unused]] const auto drained = shared.drain();
  EXPECT_DOUBLE_EQ(metrics_->queue_size_gauge("shared").Value(), 0.0);
}

TEST(Metrics, RepeatedInitKeepsFirstRegistry)
{
  shutdown_metrics();
  ASSERT_TRUE(init_metrics(0));
  auto first = get_metrics();

  EXPECT_FALSE(init_metrics(0));
  EXPECT_EQ(get_metrics(), first);

  shutdown_metrics();
  EXPECT_EQ(get_metrics(), nullptr);
}

TEST(Metrics, HelpersAreNoOpsWhenDisabled)
{
  shutdown_metrics();
  record_request(1.0);
  record_timeout();
  record_failed_request();
  record_dropped_response();
  record_flush("full", 1, 1.0);
  record_worker_restart();
  set_workers_alive(1);
  set_queue_size("shared", 1);
  EXPECT_EQ(get_metrics(), nullptr);
}

TEST(Metrics, InitFailsWhenPortIsTaken)
{
  shutdown_metrics();

  int reserved_socket = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(reserved_socket, 0);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = 0;
  ASSERT_EQ(
      ::bind(reserved_socket, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)),
      0);
  ASSERT_EQ(::listen(reserved_socket, 1), 0);

  socklen_t addr_len = sizeof(addr);
  ASSERT_EQ(
      ::getsockname(
          reserved_socket, reinterpret_cast<sockaddr*>(&addr), &addr_len),
      0);
  const int reserved_port = ntohs(addr.sin_port);

  EXPECT_FALSE(init_metrics(reserved_port));
  EXPECT_EQ(get_metrics(), nullptr);
  ::close(reserved_socket);
}

TEST(Metrics, RegistryDetachesFromExposerOnDestruction)
{
  int registered = 0;
  int removed = 0;
  {
    MetricsRegistry registry(
        0, std::make_unique<CountingExposer>(&registered, &removed));
    EXPECT_EQ(registered, 1);
    EXPECT_EQ(removed, 0);
  }
  EXPECT_EQ(removed, 1);
}
