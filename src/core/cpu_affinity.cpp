#include "cpu_affinity.hpp"

#include <cstddef>
#include <format>

#include "utils/logger.hpp"

namespace microbatch_server {

namespace {
using BitmapPtr =
    std::unique_ptr<std::remove_pointer_t<hwloc_bitmap_t>, decltype(&hwloc_bitmap_free)>;
}  // namespace

CpuTopology::CpuTopology() : topology_(nullptr, hwloc_topology_destroy)
{
  hwloc_topology_t raw{};
  if (hwloc_topology_init(&raw) != 0) {
    log_warning("Failed to initialise hwloc topology; workers run unpinned");
    return;
  }

  topology_.reset(raw);

  if (hwloc_topology_load(topology_.get()) != 0) {
    log_warning("Failed to load hwloc topology; workers run unpinned");
    topology_.reset();
  }
}

auto
CpuTopology::processing_unit_ids() const -> std::vector<unsigned>
{
  std::vector<unsigned> cpu_ids;
  if (!topology_) {
    return cpu_ids;
  }

  const int pu_count = hwloc_get_nbobjs_by_type(topology_.get(), HWLOC_OBJ_PU);
  if (pu_count <= 0) {
    return cpu_ids;
  }

  cpu_ids.reserve(static_cast<std::size_t>(pu_count));
  for (int idx = 0; idx < pu_count; ++idx) {
    const hwloc_obj_t obj =
        hwloc_get_obj_by_type(topology_.get(), HWLOC_OBJ_PU, idx);
    if (obj == nullptr) {
      continue;
    }
    cpu_ids.push_back(
        obj->os_index != static_cast<unsigned>(-1) ? obj->os_index
                                                   : obj->logical_index);
  }
  return cpu_ids;
}

auto
CpuTopology::bind_current_thread(unsigned cpu_id) const -> bool
{
  if (!topology_) {
    return false;
  }

  BitmapPtr cpuset(hwloc_bitmap_alloc(), hwloc_bitmap_free);
  if (!cpuset) {
    log_warning("Failed to allocate hwloc cpuset");
    return false;
  }
  if (hwloc_bitmap_only(cpuset.get(), cpu_id) != 0) {
    log_warning(std::format("Invalid CPU id {} for binding", cpu_id));
    return false;
  }
  if (hwloc_set_cpubind(topology_.get(), cpuset.get(), HWLOC_CPUBIND_THREAD) !=
      0) {
    log_warning(std::format("Failed to bind thread to CPU {}", cpu_id));
    return false;
  }
  return true;
}

auto
assign_worker_cores(
    int worker_count, const std::vector<int>& configured_core_ids,
    const std::vector<unsigned>& processing_unit_ids)
    -> std::vector<std::optional<unsigned>>
{
  std::vector<std::optional<unsigned>> cores;
  if (worker_count <= 0) {
    return cores;
  }
  cores.reserve(static_cast<std::size_t>(worker_count));

  for (int worker = 0; worker < worker_count; ++worker) {
    const auto index = static_cast<std::size_t>(worker);
    if (!configured_core_ids.empty()) {
      if (index < configured_core_ids.size() && configured_core_ids[index] >= 0) {
        cores.emplace_back(static_cast<unsigned>(configured_core_ids[index]));
      } else {
        cores.emplace_back(std::nullopt);
      }
      continue;
    }
    if (index < processing_unit_ids.size()) {
      cores.emplace_back(processing_unit_ids[index]);
    } else {
      cores.emplace_back(std::nullopt);
    }
  }
  return cores;
}

}  // namespace microbatch_server
