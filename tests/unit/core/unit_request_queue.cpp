#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "core/request_queue.hpp"

using namespace microbatch_server;
using namespace std::chrono_literals;

namespace {
auto
make_request(RequestId id, std::string payload) -> ClassificationRequest
{
  ClassificationRequest request;
  request.id = id;
  request.payload = std::move(payload);
  request.enqueued_at = std::chrono::steady_clock::now();
  return request;
}
}  // namespace

TEST(RequestQueue, PopsInFifoOrder)
{
  RequestQueue queue;
  ASSERT_TRUE(queue.push(make_request(1, "a")));
  ASSERT_TRUE(queue.push(make_request(2, "b")));
  ASSERT_TRUE(queue.push(make_request(3, "c")));
  EXPECT_EQ(queue.size(), 3U);

  std::vector<RequestId> order;
  ClassificationRequest request;
  while (queue.try_pop(request)) {
    order.push_back(request.id);
  }
  EXPECT_EQ(order, (std::vector<RequestId>{1, 2, 3}));
  EXPECT_EQ(queue.size(), 0U);
}

TEST(RequestQueue, WaitTimesOutWhenEmpty)
{
  RequestQueue queue;
  ClassificationRequest request;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.wait_for_and_pop(request, 20ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 20ms);
}

TEST(RequestQueue, WaitWakesOnPush)
{
  RequestQueue queue;
  std::jthread producer([&queue] {
    std::this_thread::sleep_for(10ms);
    ASSERT_TRUE(queue.push(make_request(7, "late")));
  });
  ClassificationRequest request;
  ASSERT_TRUE(queue.wait_for_and_pop(request, 5s));
  EXPECT_EQ(request.id, 7U);
  EXPECT_EQ(request.payload, "late");
}

TEST(RequestQueue, ShutdownRejectsPushAndWakesWaiters)
{
  RequestQueue queue{"worker_0"};
  EXPECT_EQ(queue.name(), "worker_0");
  std::jthread closer([&queue] {
    std::this_thread::sleep_for(10ms);
    queue.shutdown();
  });
  ClassificationRequest request;
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.wait_for_and_pop(request, 5s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_TRUE(queue.is_shutdown());
  EXPECT_FALSE(queue.push(make_request(1, "rejected")));
}

TEST(RequestQueue, DrainReturnsRemainingRequests)
{
  RequestQueue queue;
  ASSERT_TRUE(queue.push(make_request(1, "a")));
  ASSERT_TRUE(queue.push(make_request(2, "b")));
  queue.shutdown();

  ClassificationRequest request;
  ASSERT_TRUE(queue.try_pop(request));
  EXPECT_EQ(request.id, 1U);

  const auto drained = queue.drain();
  ASSERT_EQ(drained.size(), 1U);
  EXPECT_EQ(drained.front().id, 2U);
  EXPECT_EQ(queue.size(), 0U);
}
