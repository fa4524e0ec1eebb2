#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "classification_request.hpp"
#include "monitoring/metrics.hpp"

namespace microbatch_server {
// =============================================================================
// Thread-safe FIFO of classification requests. Workers block on it with a
// timeout so they stay responsive to their batch deadline.
// =============================================================================

class RequestQueue {
 public:
  explicit RequestQueue(std::string name = "shared") : name_(std::move(name))
  {
  }

  [[nodiscard]] auto push(ClassificationRequest request) -> bool
  {
    {
      const std::scoped_lock lock(mutex_);
      if (shutdown_) {
        return false;
      }
      queue_.push_back(std::move(request));
      set_queue_size(name_, queue_.size());
    }
    cv_.notify_one();
    return true;
  }

  [[nodiscard]] auto try_pop(ClassificationRequest& request) -> bool
  {
    const std::scoped_lock lock(mutex_);
    return pop_locked(request);
  }

  template <typename Rep, typename Period>
  [[nodiscard]] auto wait_for_and_pop(
      ClassificationRequest& request,
      const std::chrono::duration<Rep, Period>& timeout) -> bool
  {
    std::unique_lock lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this] {
          return !queue_.empty() || shutdown_;
        })) {
      return false;
    }
    return pop_locked(request);
  }

  // Removes everything still queued, typically after shutdown().
  [[nodiscard]] auto drain() -> std::vector<ClassificationRequest>
  {
    const std::scoped_lock lock(mutex_);
    std::vector<ClassificationRequest> pending(
        std::make_move_iterator(queue_.begin()),
        std::make_move_iterator(queue_.end()));
    queue_.clear();
    set_queue_size(name_, 0);
    return pending;
  }

  void shutdown()
  {
    {
      const std::scoped_lock lock(mutex_);
      shutdown_ = true;
    }
    cv_.notify_all();
  }

  [[nodiscard]] auto is_shutdown() const -> bool
  {
    const std::scoped_lock lock(mutex_);
    return shutdown_;
  }

  [[nodiscard]] auto size() const -> std::size_t
  {
    const std::scoped_lock lock(mutex_);
    return queue_.size();
  }

  [[nodiscard]] auto name() const -> const std::string& { return name_; }

 private:
  auto pop_locked(ClassificationRequest& request) -> bool
  {
    if (queue_.empty()) {
      return false;
    }
    request = std::move(queue_.front());
    queue_.pop_front();
    set_queue_size(name_, queue_.size());
    return true;
  }

  std::string name_;
  mutable std::mutex mutex_;
  std::deque<ClassificationRequest> queue_;
  bool shutdown_ = false;
  std::condition_variable cv_;
};
}  // namespace microbatch_server
