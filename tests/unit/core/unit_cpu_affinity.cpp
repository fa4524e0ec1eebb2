#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "core/cpu_affinity.hpp"

using namespace microbatch_server;

TEST(CpuAffinity, ConfiguredCoresTakePrecedence)
{
  const auto cores = assign_worker_cores(3, {7, 5, 3}, {0, 1, 2, 3});
  EXPECT_EQ(
      cores, (std::vector<std::optional<unsigned>>{7U, 5U, 3U}));
}

TEST(CpuAffinity, ProcessingUnitsUsedInOrder)
{
  const auto cores = assign_worker_cores(2, {}, {4, 6, 8});
  EXPECT_EQ(cores, (std::vector<std::optional<unsigned>>{4U, 6U}));
}

TEST(CpuAffinity, WorkersBeyondAvailableCoresRunUnpinned)
{
  const auto from_topology = assign_worker_cores(3, {}, {0});
  EXPECT_EQ(
      from_topology,
      (std::vector<std::optional<unsigned>>{0U, std::nullopt, std::nullopt}));

  const auto from_config = assign_worker_cores(2, {1}, {0, 1, 2});
  EXPECT_EQ(
      from_config, (std::vector<std::optional<unsigned>>{1U, std::nullopt}));
}

TEST(CpuAffinity, NonPositiveWorkerCountYieldsNothing)
{
  EXPECT_TRUE(assign_worker_cores(0, {}, {0, 1}).empty());
  EXPECT_TRUE(assign_worker_cores(-2, {}, {0, 1}).empty());
}

TEST(CpuAffinity, TopologyBindsToAnAvailableUnit)
{
  const CpuTopology topology;
  if (!topology.available()) {
    GTEST_SKIP() << "hwloc topology unavailable";
  }
  const auto units = topology.processing_unit_ids();
  ASSERT_FALSE(units.empty());
  // Binding may be refused inside restricted containers; it must not throw.
  [[maybe_unused]] const bool bound = topology.bind_current_thread(units.front());
}
