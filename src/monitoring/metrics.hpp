#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace prometheus {
class Collectable;
template <typename T>
class Family;
}  // namespace prometheus

namespace microbatch_server {

class MetricsRegistry {
 public:
  struct ExposerHandle {
    ExposerHandle() = default;
    ExposerHandle(const ExposerHandle&) = delete;
    auto operator=(const ExposerHandle&) -> ExposerHandle& = delete;
    ExposerHandle(ExposerHandle&&) = delete;
    auto operator=(ExposerHandle&&) -> ExposerHandle& = delete;
    virtual ~ExposerHandle() = default;
    virtual void RegisterCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
    virtual void RemoveCollectable(
        const std::shared_ptr<prometheus::Collectable>& collectable) = 0;
  };

  explicit MetricsRegistry(int port);
  MetricsRegistry(int port, std::unique_ptr<ExposerHandle> exposer_handle);
  ~MetricsRegistry() noexcept;
  MetricsRegistry(const MetricsRegistry&) = delete;
  auto operator=(const MetricsRegistry&) -> MetricsRegistry& = delete;
  MetricsRegistry(MetricsRegistry&&) = delete;
  auto operator=(MetricsRegistry&&) -> MetricsRegistry& = delete;

  std::shared_ptr<prometheus::Registry>
      registry;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* requests_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* timeouts_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* failed_requests_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* dropped_responses_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Counter* worker_restarts_total{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Histogram* request_latency{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Histogram* inference_latency{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Histogram* batch_size{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Gauge* workers_alive{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Counter>* flushes_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  prometheus::Family<prometheus::Gauge>* queue_size_family{
      nullptr};  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)

  auto flush_counter(std::string_view reason) -> prometheus::Counter&;
  auto queue_size_gauge(std::string_view queue) -> prometheus::Gauge&;

 private:
  void initialize(int port, std::unique_ptr<ExposerHandle> exposer_handle);

  std::unique_ptr<ExposerHandle> exposer_;
};

auto init_metrics(int port) -> bool;
void shutdown_metrics();
auto get_metrics() -> std::shared_ptr<MetricsRegistry>;

// Recording helpers; all of them are no-ops while metrics are disabled.
void set_queue_size(std::string_view queue, std::size_t size);
void record_request(double latency_ms);
void record_timeout();
void record_failed_request();
void record_dropped_response();
void record_flush(std::string_view reason, std::size_t size, double latency_ms);
void record_worker_restart();
void set_workers_alive(std::size_t alive);

}  // namespace microbatch_server
