#include "worker.hpp"

#include <exception>
#include <format>
#include <memory>
#include <utility>

#include "utils/exceptions.hpp"

namespace microbatch_server {

auto
worker_state_name(WorkerState state) -> const char*
{
  switch (state) {
    case WorkerState::Starting:
      return "starting";
    case WorkerState::Running:
      return "running";
    case WorkerState::Failed:
      return "failed";
    case WorkerState::Stopped:
    default:
      return "stopped";
  }
}

Worker::Worker(WorkerContext context) : context_(std::move(context))
{
  if (context_.queue == nullptr || context_.sink == nullptr ||
      !context_.predictor_factory) {
    throw InvalidConfigException(std::format(
        "Worker {} requires a queue, a response sink and a predictor factory",
        context_.id));
  }
}

Worker::~Worker()
{
  stop();
}

void
Worker::start()
{
  if (thread_.joinable()) {
    throw InvalidConfigException(
        std::format("Worker {} is already started", context_.id));
  }
  state_.store(WorkerState::Starting, std::memory_order_release);
  touch_heartbeat();
  thread_ = std::jthread(
      [this](const std::stop_token& stop) { thread_main(stop); });
}

void
Worker::request_stop()
{
  if (thread_.joinable()) {
    thread_.request_stop();
  }
}

void
Worker::join()
{
  if (thread_.joinable()) {
    thread_.join();
  }
}

void
Worker::stop()
{
  request_stop();
  join();
}

void
Worker::restart()
{
  join();
  restarts_.fetch_add(1, std::memory_order_acq_rel);
  start();
}

auto
Worker::is_alive() const -> bool
{
  const auto current = state();
  return current == WorkerState::Starting || current == WorkerState::Running;
}

auto
Worker::heartbeat_age(clock::time_point now) const -> clock::duration
{
  const clock::time_point last{
      clock::duration(heartbeat_.load(std::memory_order_relaxed))};
  return now > last ? now - last : clock::duration::zero();
}

auto
Worker::last_error() const -> std::string
{
  const std::scoped_lock lock(error_mutex_);
  return last_error_;
}

void
Worker::touch_heartbeat()
{
  heartbeat_.store(
      clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

void
Worker::pin_to_core()
{
  pinned_.store(false, std::memory_order_release);
  if (!context_.core.has_value()) {
    log_debug(
        context_.verbosity,
        std::format("Worker {} has no dedicated core", context_.id));
    return;
  }
  if (context_.topology == nullptr || !context_.topology->available()) {
    log_warning(std::format(
        "CPU topology unavailable; worker {} runs unpinned", context_.id));
    return;
  }
  if (!context_.topology->bind_current_thread(*context_.core)) {
    log_warning(std::format(
        "Worker {} could not be pinned to CPU {}; running unpinned",
        context_.id, *context_.core));
    return;
  }
  pinned_.store(true, std::memory_order_release);
  log_debug(
      context_.verbosity,
      std::format("Worker {} pinned to CPU {}", context_.id, *context_.core));
}

void
Worker::thread_main(const std::stop_token& stop)
{
  touch_heartbeat();
  pin_to_core();

  try {
    auto predictor = context_.predictor_factory(context_.id);
    if (!predictor) {
      throw ModelLoadingException(
          std::format("Predictor factory returned nothing for worker {}",
                      context_.id));
    }

    BatchingLoopConfig loop_config;
    loop_config.worker_id = context_.id;
    loop_config.queue = context_.queue;
    loop_config.predictor = predictor.get();
    loop_config.sink = context_.sink;
    loop_config.settings = context_.batching;
    loop_config.verbosity = context_.verbosity;
    loop_config.heartbeat = &heartbeat_;
    BatchingLoop loop(loop_config);

    state_.store(WorkerState::Running, std::memory_order_release);
    log_info(
        context_.verbosity,
        std::format("Worker {} initialized and ready", context_.id));

    loop.run(stop);
    state_.store(WorkerState::Stopped, std::memory_order_release);
  }
  catch (const std::exception& e) {
    {
      const std::scoped_lock lock(error_mutex_);
      last_error_ = e.what();
    }
    log_error(std::format("Worker {} failed: {}", context_.id, e.what()));
    state_.store(WorkerState::Failed, std::memory_order_release);
  }
}

}  // namespace microbatch_server
