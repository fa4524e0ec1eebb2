#include "pending_request_table.hpp"

#include <format>
#include <optional>
#include <utility>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace microbatch_server {

auto
PendingRequestTable::register_request(RequestId request_id)
    -> std::future<ClassificationResponse>
{
  const std::scoped_lock lock(mutex_);
  auto [it, inserted] = pending_.try_emplace(request_id);
  if (!inserted) {
    throw DuplicateRequestIdException(
        std::format("Request id {} is already pending", request_id));
  }
  return it->second.get_future();
}

auto
PendingRequestTable::publish(ClassificationResponse response) -> bool
{
  std::optional<std::promise<ClassificationResponse>> handle;
  {
    const std::scoped_lock lock(mutex_);
    auto node = pending_.extract(response.id);
    if (node.empty()) {
      ++dropped_;
    } else {
      handle.emplace(std::move(node.mapped()));
    }
  }

  if (!handle) {
    log_debug(verbosity_, std::format(
        "Dropping response for abandoned request {}", response.id));
    record_dropped_response();
    return false;
  }

  handle->set_value(std::move(response));
  return true;
}

auto
PendingRequestTable::abandon(RequestId request_id) -> bool
{
  const std::scoped_lock lock(mutex_);
  return pending_.erase(request_id) > 0;
}

auto
PendingRequestTable::size() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return pending_.size();
}

auto
PendingRequestTable::dropped_count() const -> std::size_t
{
  const std::scoped_lock lock(mutex_);
  return dropped_;
}

}  // namespace microbatch_server
