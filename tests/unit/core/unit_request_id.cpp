#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include "core/request_id.hpp"

using namespace microbatch_server;
using namespace std::chrono_literals;

TEST(RequestIdGenerator, FrozenClockStillYieldsIncreasingIds)
{
  RequestIdGenerator generator([] { return 1000us; });
  EXPECT_EQ(generator.next(), 1000U);
  EXPECT_EQ(generator.next(), 1001U);
  EXPECT_EQ(generator.next(), 1002U);
}

TEST(RequestIdGenerator, FollowsClockWhenItAdvances)
{
  std::chrono::microseconds now{10};
  RequestIdGenerator generator([&now] { return now; });
  EXPECT_EQ(generator.next(), 10U);
  now = 500us;
  EXPECT_EQ(generator.next(), 500U);
  now = 400us;
  EXPECT_EQ(generator.next(), 501U);
}

TEST(RequestIdGenerator, ConcurrentCallersNeverCollide)
{
  constexpr int kThreads = 8;
  constexpr int kPerThread = 2000;
  RequestIdGenerator generator;
  std::vector<std::vector<RequestId>> per_thread(kThreads);
  {
    std::vector<std::jthread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&generator, &ids = per_thread[t]] {
        for (int i = 0; i < kPerThread; ++i) {
          ids.push_back(generator.next());
        }
      });
    }
  }
  std::set<RequestId> unique;
  for (const auto& ids : per_thread) {
    EXPECT_TRUE(std::ranges::is_sorted(ids));
    unique.insert(ids.begin(), ids.end());
  }
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
