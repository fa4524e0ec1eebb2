#pragma once

#include <hwloc.h>

#include <memory>
#include <optional>
#include <type_traits>
#include <vector>

namespace microbatch_server {

// =============================================================================
// CpuTopology
// -----------------------------------------------------------------------------
// hwloc view of the machine used to pin worker threads. Every failure degrades
// to "unpinned" with a warning; nothing here throws.
// =============================================================================
class CpuTopology {
 public:
  CpuTopology();

  [[nodiscard]] auto available() const -> bool { return topology_ != nullptr; }

  // OS indices of the processing units, in topology order.
  [[nodiscard]] auto processing_unit_ids() const -> std::vector<unsigned>;

  // Binds the calling thread to a single processing unit.
  [[nodiscard]] auto bind_current_thread(unsigned cpu_id) const -> bool;

 private:
  using TopologyPtr = std::unique_ptr<
      std::remove_pointer_t<hwloc_topology_t>,
      decltype(&hwloc_topology_destroy)>;

  TopologyPtr topology_;
};

// Core of each worker: the configured ids when present, otherwise the
// processing units in order. Workers beyond the available cores get nullopt.
auto assign_worker_cores(
    int worker_count, const std::vector<int>& configured_core_ids,
    const std::vector<unsigned>& processing_unit_ids)
    -> std::vector<std::optional<unsigned>>;

}  // namespace microbatch_server
