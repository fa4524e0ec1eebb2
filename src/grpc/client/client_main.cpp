#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <format>
#include <iostream>
#include <mutex>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "classifier_client.hpp"
#include "client_args.hpp"
#include "core/latency_statistics.hpp"
#include "utils/logger.hpp"

namespace {

struct RunSummary {
  std::vector<double> roundtrip_ms;
  std::size_t failures = 0;
};

auto
run_requests(
    microbatch_server::ClassifierClient& client,
    const microbatch_server::ClientConfig& config) -> RunSummary
{
  const std::size_t total =
      config.sentences.size() * static_cast<std::size_t>(config.request_nb);
  const auto timeout = std::chrono::milliseconds(config.timeout_ms);

  std::atomic<std::size_t> next_index{0};
  std::mutex output_mutex;
  RunSummary summary;
  summary.roundtrip_ms.reserve(total);

  {
    std::vector<std::jthread> threads;
    threads.reserve(static_cast<std::size_t>(config.concurrency));
    for (int t = 0; t < config.concurrency; ++t) {
      threads.emplace_back([&]() {
        for (auto index = next_index.fetch_add(1); index < total;
             index = next_index.fetch_add(1)) {
          const auto& sentence =
              config.sentences[index % config.sentences.size()];
          const auto outcome = client.Classify(sentence, timeout);
          const auto line =
              microbatch_server::format_outcome_json(sentence, outcome);

          const std::scoped_lock lock(output_mutex);
          std::cout << line << '\n';
          if (outcome.status.ok()) {
            summary.roundtrip_ms.push_back(outcome.roundtrip_ms);
          } else {
            ++summary.failures;
          }
        }
      });
    }
  }
  std::cout << std::flush;
  return summary;
}

void
log_summary(
    const RunSummary& summary, microbatch_server::VerbosityLevel verbosity)
{
  const auto stats =
      microbatch_server::compute_latency_statistics(summary.roundtrip_ms);
  if (!stats) {
    microbatch_server::log_stats(
        verbosity, std::format("No successful request ({} failed)",
                               summary.failures));
    return;
  }
  microbatch_server::log_stats(
      verbosity,
      std::format(
          "{} ok / {} failed | latency ms min {:.3f} p50 {:.3f} p95 {:.3f} "
          "p99 {:.3f} max {:.3f} mean {:.3f}",
          stats->count, summary.failures, stats->min, stats->p50, stats->p95,
          stats->p99, stats->max, stats->mean));
}

}  // namespace

auto
main(int argc, char* argv[]) -> int
{
  std::vector<const char*> const_argv(argv, argv + argc);
  std::span<const char*> args{const_argv};
  const microbatch_server::ClientConfig config =
      microbatch_server::parse_client_args(args);
  if (config.show_help) {
    microbatch_server::display_client_help(args.front());
    return 0;
  }
  if (!config.valid) {
    microbatch_server::log_error("Invalid program options.");
    return 1;
  }

  auto channel = grpc::CreateChannel(
      config.server_address, grpc::InsecureChannelCredentials());
  microbatch_server::ClassifierClient client(channel, config.verbosity);

  if (!client.ServerIsLive()) {
    return 1;
  }

  if (config.pool_status) {
    const auto status = client.PoolStatus();
    if (!status) {
      return 1;
    }
    std::cout << microbatch_server::format_pool_status_json(*status) << '\n';
    return 0;
  }

  if (!client.ServerIsReady()) {
    return 1;
  }

  const auto summary = run_requests(client, config);
  log_summary(summary, config.verbosity);
  return summary.failures == 0 ? 0 : 1;
}
