#include "worker_pool.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "monitoring/metrics.hpp"
#include "utils/exceptions.hpp"

namespace microbatch_server {

WorkerPool::WorkerPool(
    PoolSettings settings, BatchingSettings batching,
    PredictorFactory predictor_factory, ResponseSink* sink,
    VerbosityLevel verbosity)
    : settings_(std::move(settings)), batching_(batching),
      predictor_factory_(std::move(predictor_factory)), sink_(sink),
      verbosity_(verbosity)
{
  if (settings_.worker_count < 1 || settings_.worker_count > kMaxWorkerCount) {
    throw InvalidConfigException(std::format(
        "Worker count must be between 1 and {}, got {}", kMaxWorkerCount,
        settings_.worker_count));
  }
  if (batching_.max_batch_size < 1) {
    throw InvalidConfigException("max_batch_size must be at least 1");
  }
  if (sink_ == nullptr || !predictor_factory_) {
    throw InvalidConfigException(
        "WorkerPool requires a response sink and a predictor factory");
  }

  const auto worker_count = static_cast<std::size_t>(settings_.worker_count);
  if (settings_.routing == RoutingPolicy::RoundRobin) {
    for (std::size_t i = 0; i < worker_count; ++i) {
      queues_.push_back(
          std::make_unique<RequestQueue>(std::format("worker_{}", i)));
    }
  } else {
    queues_.push_back(std::make_unique<RequestQueue>("shared"));
  }

  std::vector<std::optional<unsigned>> cores(worker_count);
  if (settings_.pin_workers) {
    cores = assign_worker_cores(
        settings_.worker_count, settings_.core_ids,
        topology_.processing_unit_ids());
  }

  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    WorkerContext context;
    context.id = static_cast<int>(i);
    context.core = cores[i];
    context.queue =
        queues_.size() == 1 ? queues_.front().get() : queues_[i].get();
    context.sink = sink_;
    context.predictor_factory = predictor_factory_;
    context.batching = batching_;
    context.topology = settings_.pin_workers ? &topology_ : nullptr;
    context.verbosity = verbosity_;
    workers_.push_back(std::make_unique<Worker>(std::move(context)));
  }
  stall_reported_.assign(worker_count, false);
}

WorkerPool::~WorkerPool()
{
  stop();
}

void
WorkerPool::start()
{
  if (stopped_.load(std::memory_order_acquire)) {
    throw ServiceUnavailableException("Worker pool cannot be restarted");
  }
  if (running_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  for (auto& worker : workers_) {
    worker->start();
  }
  last_alive_ = workers_.size();
  set_workers_alive(last_alive_);

  supervisor_ = std::jthread(
      [this](const std::stop_token& stop) { supervise(stop); });

  log_info(
      verbosity_,
      std::format(
          "Worker pool started with {} worker(s), {} routing, batch <= {}, "
          "delay {} ms",
          workers_.size(), routing_policy_name(settings_.routing),
          batching_.max_batch_size, batching_.max_batch_delay.count()));
}

void
WorkerPool::stop()
{
  if (stopped_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  running_.store(false, std::memory_order_release);

  if (supervisor_.joinable()) {
    supervisor_.request_stop();
    supervisor_cv_.notify_all();
    supervisor_.join();
  }

  for (auto& worker : workers_) {
    worker->request_stop();
  }
  for (auto& queue : queues_) {
    queue->shutdown();
  }
  for (auto& worker : workers_) {
    worker->join();
  }
  for (auto& queue : queues_) {
    answer_stopped(*queue, kPoolStoppedMessage);
  }

  set_workers_alive(0);
  log_info(verbosity_, "Worker pool stopped");
}

auto
WorkerPool::select_queue() -> RequestQueue*
{
  if (queues_.size() == 1) {
    const bool any_active = std::ranges::any_of(
        workers_, [](const auto& worker) { return !worker->retired(); });
    return any_active ? queues_.front().get() : nullptr;
  }

  const auto count = workers_.size();
  const auto start = next_queue_.fetch_add(1, std::memory_order_relaxed);
  RequestQueue* fallback = nullptr;
  for (std::size_t attempt = 0; attempt < count; ++attempt) {
    const auto& worker = workers_[(start + attempt) % count];
    if (worker->retired()) {
      continue;
    }
    if (worker->state() != WorkerState::Failed) {
      return worker->queue();
    }
    if (fallback == nullptr) {
      fallback = worker->queue();
    }
  }
  return fallback;
}

auto
WorkerPool::route(ClassificationRequest request) -> bool
{
  if (!is_running()) {
    return false;
  }
  auto* queue = select_queue();
  if (queue == nullptr) {
    log_warning("No worker available to accept requests");
    return false;
  }
  return queue->push(std::move(request));
}

auto
WorkerPool::alive_count() const -> std::size_t
{
  return static_cast<std::size_t>(std::ranges::count_if(
      workers_, [](const auto& worker) { return worker->is_alive(); }));
}

auto
WorkerPool::queue_size(std::size_t index) const -> std::size_t
{
  return index < queues_.size() ? queues_[index]->size() : 0;
}

auto
WorkerPool::status() const -> std::vector<WorkerStatus>
{
  std::vector<WorkerStatus> snapshot;
  snapshot.reserve(workers_.size());
  for (const auto& worker : workers_) {
    snapshot.push_back(WorkerStatus{
        .id = worker->id(),
        .core = worker->core(),
        .pinned = worker->pinned(),
        .state = worker->state(),
        .restarts = worker->restart_count(),
        .retired = worker->retired()});
  }
  return snapshot;
}

void
WorkerPool::supervise(const std::stop_token& stop)
{
  while (!stop.stop_requested()) {
    {
      std::unique_lock lock(supervisor_cv_mutex_);
      supervisor_cv_.wait_for(
          lock, stop, settings_.health_check_interval, [] { return false; });
    }
    if (stop.stop_requested()) {
      break;
    }
    check_workers();
  }
}

void
WorkerPool::check_workers()
{
  const std::scoped_lock lock(supervise_mutex_);
  if (!is_running()) {
    return;
  }

  const auto now = Worker::clock::now();
  for (std::size_t i = 0; i < workers_.size(); ++i) {
    auto& worker = *workers_[i];
    if (worker.retired()) {
      continue;
    }

    if (worker.state() == WorkerState::Failed) {
      if (worker.restart_count() < settings_.max_restarts) {
        log_warning(std::format(
            "Restarting worker {} (restart {}/{}) after failure: {}",
            worker.id(), worker.restart_count() + 1, settings_.max_restarts,
            worker.last_error()));
        record_worker_restart();
        stall_reported_[i] = false;
        worker.restart();
      } else {
        retire_worker(worker);
      }
      continue;
    }

    if (worker.state() == WorkerState::Running) {
      const bool stalled = worker.heartbeat_age(now) > settings_.stall_timeout;
      if (stalled && !stall_reported_[i]) {
        log_warning(std::format(
            "Worker {} has not reported a heartbeat for more than {} ms",
            worker.id(), settings_.stall_timeout.count()));
      }
      stall_reported_[i] = stalled;
    }
  }

  const auto alive = alive_count();
  if (alive != last_alive_) {
    set_workers_alive(alive);
    if (alive < workers_.size()) {
      log_warning(std::format(
          "Worker pool running degraded: {}/{} worker(s) alive", alive,
          workers_.size()));
    } else {
      log_info(
          verbosity_,
          std::format("Worker pool back to full capacity ({})", alive));
    }
    last_alive_ = alive;
  }
}

void
WorkerPool::retire_worker(Worker& worker)
{
  worker.retire();
  worker.join();
  log_error(std::format(
      "Worker {} exceeded {} restart(s) and is left stopped", worker.id(),
      settings_.max_restarts));

  // A queue left without consumers is closed and what it holds is answered.
  const bool orphaned =
      queues_.size() > 1 ||
      std::ranges::all_of(
          workers_, [](const auto& other) { return other->retired(); });
  if (orphaned) {
    worker.queue()->shutdown();
    answer_stopped(
        *worker.queue(), std::format("Worker {} unavailable", worker.id()));
  }
}

void
WorkerPool::answer_stopped(RequestQueue& queue, const std::string& message)
{
  auto pending = queue.drain();
  if (pending.empty()) {
    return;
  }
  log_warning(std::format(
      "Answering {} queued request(s) on '{}': {}", pending.size(),
      queue.name(), message));
  for (const auto& request : pending) {
    if (!sink_->publish(ClassificationResponse::refused(request.id, message))) {
      log_trace(
          verbosity_,
          std::format("No caller waits for queued request {}", request.id));
    }
  }
}

}  // namespace microbatch_server
