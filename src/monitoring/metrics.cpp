#include "monitoring/metrics.hpp"

#include <prometheus/exposer.h>
#include <prometheus/histogram.h>

#include <atomic>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include "utils/logger.hpp"

namespace microbatch_server {

class PrometheusExposerHandle : public MetricsRegistry::ExposerHandle {
 public:
  explicit PrometheusExposerHandle(std::unique_ptr<prometheus::Exposer> exposer)
      : exposer_(std::move(exposer))
  {
  }

  void RegisterCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RegisterCollectable(collectable);
  }

  void RemoveCollectable(
      const std::shared_ptr<prometheus::Collectable>& collectable) override
  {
    exposer_->RemoveCollectable(collectable);
  }

 private:
  std::unique_ptr<prometheus::Exposer> exposer_;
};

namespace {

const prometheus::Histogram::BucketBoundaries kRequestLatencyMsBuckets{
    1, 5, 10, 25, 50, 100, 150, 250, 500, 1000, 5000, 30000};

const prometheus::Histogram::BucketBoundaries kInferenceLatencyMsBuckets{
    1, 5, 10, 25, 50, 100, 250, 500, 1000};

const prometheus::Histogram::BucketBoundaries kBatchSizeBuckets{
    1, 2, 4, 8, 16, 24, 32, 64, 128};

auto
metrics_atomic() -> std::atomic<std::shared_ptr<MetricsRegistry>>&
{
  static std::atomic<std::shared_ptr<MetricsRegistry>> instance{nullptr};
  return instance;
}

auto
load_metrics() -> std::shared_ptr<MetricsRegistry>
{
  return metrics_atomic().load(std::memory_order_acquire);
}

}  // namespace

MetricsRegistry::MetricsRegistry(int port) : MetricsRegistry(port, nullptr) {}

MetricsRegistry::MetricsRegistry(
    int port, std::unique_ptr<ExposerHandle> exposer_handle)
    : registry(std::make_shared<prometheus::Registry>())
{
  initialize(port, std::move(exposer_handle));
}

void
MetricsRegistry::initialize(
    int port, std::unique_ptr<ExposerHandle> exposer_handle)
{
  try {
    if (!exposer_handle) {
      auto exposer = std::make_unique<prometheus::Exposer>(
          std::format("0.0.0.0:{}", port));
      exposer_handle =
          std::make_unique<PrometheusExposerHandle>(std::move(exposer));
    }
    exposer_handle->RegisterCollectable(registry);
    exposer_ = std::move(exposer_handle);
  }
  catch (const std::exception& e) {
    log_error(std::string("Failed to initialize metrics exposer: ") + e.what());
    throw;
  }

  requests_total = &prometheus::BuildCounter()
                        .Name("microbatch_requests_total")
                        .Help("Classification requests answered")
                        .Register(*registry)
                        .Add({});
  timeouts_total = &prometheus::BuildCounter()
                        .Name("microbatch_timeouts_total")
                        .Help("Requests that exhausted their wait budget")
                        .Register(*registry)
                        .Add({});
  failed_requests_total =
      &prometheus::BuildCounter()
           .Name("microbatch_failed_requests_total")
           .Help("Requests answered with an inference error")
           .Register(*registry)
           .Add({});
  dropped_responses_total =
      &prometheus::BuildCounter()
           .Name("microbatch_dropped_responses_total")
           .Help("Responses produced for requests nobody waits for anymore")
           .Register(*registry)
           .Add({});
  worker_restarts_total = &prometheus::BuildCounter()
                               .Name("microbatch_worker_restarts_total")
                               .Help("Workers restarted by the supervisor")
                               .Register(*registry)
                               .Add({});

  request_latency = &prometheus::BuildHistogram()
                         .Name("microbatch_request_latency_ms")
                         .Help("End-to-end dispatcher latency in milliseconds")
                         .Register(*registry)
                         .Add({}, kRequestLatencyMsBuckets);
  inference_latency =
      &prometheus::BuildHistogram()
           .Name("microbatch_inference_latency_ms")
           .Help("Predictor latency per flushed batch in milliseconds")
           .Register(*registry)
           .Add({}, kInferenceLatencyMsBuckets);
  batch_size = &prometheus::BuildHistogram()
                    .Name("microbatch_batch_size")
                    .Help("Number of requests per flushed batch")
                    .Register(*registry)
                    .Add({}, kBatchSizeBuckets);

  workers_alive = &prometheus::BuildGauge()
                       .Name("microbatch_workers_alive")
                       .Help("Workers currently running their batching loop")
                       .Register(*registry)
                       .Add({});

  flushes_family = &prometheus::BuildCounter()
                        .Name("microbatch_flushes_total")
                        .Help("Batch flushes by trigger")
                        .Register(*registry);
  queue_size_family = &prometheus::BuildGauge()
                           .Name("microbatch_queue_size")
                           .Help("Requests waiting in a request queue")
                           .Register(*registry);
}

MetricsRegistry::~MetricsRegistry() noexcept
{
  if (exposer_ && registry) {
    try {
      exposer_->RemoveCollectable(registry);
    }
    catch (const std::exception& e) {
      log_error(
          std::string("Failed to remove metrics registry collectable: ") +
          e.what());
    }
  }
}

auto
MetricsRegistry::flush_counter(std::string_view reason) -> prometheus::Counter&
{
  return flushes_family->Add({{"reason", std::string(reason)}});
}

auto
MetricsRegistry::queue_size_gauge(std::string_view queue) -> prometheus::Gauge&
{
  return queue_size_family->Add({{"queue", std::string(queue)}});
}

auto
init_metrics(int port) -> bool
{
  std::shared_ptr<MetricsRegistry> expected{nullptr};

  try {
    auto new_metrics = std::make_shared<MetricsRegistry>(port);
    if (!metrics_atomic().compare_exchange_strong(
            expected, new_metrics, std::memory_order_acq_rel,
            std::memory_order_acquire)) {
      log_warning("Metrics were previously initialized");
      return false;
    }
    return true;
  }
  catch (const std::exception& e) {
    log_error(std::string("Metrics initialization failed: ") + e.what());
    return false;
  }
}

void
shutdown_metrics()
{
  metrics_atomic().store(nullptr, std::memory_order_release);
}

auto
get_metrics() -> std::shared_ptr<MetricsRegistry>
{
  return load_metrics();
}

void
set_queue_size(std::string_view queue, std::size_t size)
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->queue_size_gauge(queue).Set(static_cast<double>(size));
  }
}

void
record_request(double latency_ms)
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->requests_total->Increment();
    metrics->request_latency->Observe(latency_ms);
  }
}

void
record_timeout()
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->timeouts_total->Increment();
  }
}

void
record_failed_request()
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->failed_requests_total->Increment();
  }
}

void
record_dropped_response()
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->dropped_responses_total->Increment();
  }
}

void
record_flush(std::string_view reason, std::size_t size, double latency_ms)
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->flush_counter(reason).Increment();
    metrics->batch_size->Observe(static_cast<double>(size));
    metrics->inference_latency->Observe(latency_ms);
  }
}

void
record_worker_restart()
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->worker_restarts_total->Increment();
  }
}

void
set_workers_alive(std::size_t alive)
{
  if (auto metrics = load_metrics(); metrics) {
    metrics->workers_alive->Set(static_cast<double>(alive));
  }
}

}  // namespace microbatch_server
