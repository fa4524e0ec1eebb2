#include <torch/torch.h>

#include <chrono>
#include <csignal>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <thread>

#include "classifier_service.hpp"
#include "core/dispatcher.hpp"
#include "core/pending_request_table.hpp"
#include "core/torch_predictor.hpp"
#include "core/worker_pool.hpp"
#include "http/classify_http_server.hpp"
#include "monitoring/metrics.hpp"
#include "signal_handler.hpp"
#include "utils/config_loader.hpp"
#include "utils/exceptions.hpp"
#include "utils/logger.hpp"
#include "utils/runtime_config.hpp"

namespace microbatch_server {

auto
handle_program_arguments(std::span<char const* const> args) -> RuntimeConfig
{
  const char* config_path = nullptr;

  auto remaining = args.subspan(1);
  auto require_value = [&](std::string_view flag) {
    if (remaining.empty() || remaining.front() == nullptr) {
      log_fatal(std::format("Missing value for {} argument.\n", flag));
    }
    const char* value = remaining.front();
    remaining = remaining.subspan(1);
    return value;
  };

  while (!remaining.empty()) {
    const char* raw_arg = remaining.front();
    remaining = remaining.subspan(1);

    if (raw_arg == nullptr) {
      log_fatal("Unexpected null program argument.\n");
    }

    std::string_view arg{raw_arg};
    if (arg == "--config" || arg == "-c") {
      config_path = require_value(arg);
      continue;
    }
    log_fatal(std::format(
        "Unknown argument '{}'. Only --config/-c is supported; all other "
        "settings must live in the YAML file.\n",
        arg));
  }

  if (config_path == nullptr) {
    log_fatal("Missing required --config argument.\n");
  }

  RuntimeConfig cfg = load_config(config_path);
  cfg.config_path = config_path;

  if (!cfg.valid) {
    log_fatal("Invalid configuration file.\n");
  }

  log_info(cfg.verbosity, std::format("LibTorch version: {}", TORCH_VERSION));
  if (!cfg.name.empty()) {
    log_info(cfg.verbosity, std::format("Configuration   : {}", cfg.name));
  }
  log_info(cfg.verbosity, std::format("Model           : {}", cfg.model.path));
  log_info(
      cfg.verbosity,
      std::format(
          "Workers         : {} ({})", cfg.pool.worker_count,
          routing_policy_name(cfg.pool.routing)));
  if (cfg.http.port != 0) {
    log_info(
        cfg.verbosity,
        std::format("HTTP            : {}:{}", cfg.http.host, cfg.http.port));
  }

  return cfg;
}

void
serve(const RuntimeConfig& opts)
{
  configure_torch_threads(opts.model.intra_op_threads);

  PendingRequestTable pending(opts.verbosity);
  WorkerPool pool(
      opts.pool, opts.batching, make_torch_predictor_factory(opts.model),
      &pending, opts.verbosity);
  pool.start();

  Dispatcher dispatcher(pool, pending, opts.dispatcher, opts.verbosity);
  ClassifierServiceImpl service(dispatcher, pool, opts.verbosity);

  auto& server_ctx = server_context();

  std::jthread notifier_thread([&server_ctx]() {
    constexpr auto kNotifierSleep = std::chrono::milliseconds(10);
    while (!server_ctx.stop_requested.load(std::memory_order_relaxed)) {
      std::this_thread::sleep_for(kNotifierSleep);
    }
    server_ctx.stop_cv.notify_one();
  });

  std::jthread grpc_thread([&]() {
    const GrpcServerOptions server_options{
        opts.server_address, opts.max_message_bytes, opts.verbosity};
    RunGrpcServer(service, server_options, server_ctx);
    const std::scoped_lock lock(server_ctx.stop_mutex);
    if (!server_ctx.server) {
      server_ctx.stop_requested.store(true);
    }
  });

  std::unique_ptr<ClassifyHttpServer> http_server;
  if (opts.http.port != 0) {
    http_server = std::make_unique<ClassifyHttpServer>(
        service, HttpServerOptions{
                     .host = opts.http.host,
                     .port = opts.http.port,
                     .threads = opts.http.threads,
                     .verbosity = opts.verbosity});
    if (!http_server->start()) {
      server_ctx.stop_requested.store(true);
    }
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  {
    std::unique_lock lock(server_ctx.stop_mutex);
    server_ctx.stop_cv.wait(
        lock, [] { return server_context().stop_requested.load(); });
  }
  log_info(opts.verbosity, "Shutdown requested");

  // Waiting handlers give up on their next poll slice.
  dispatcher.shutdown();
  if (http_server) {
    http_server->stop();
  }
  StopServer(server_ctx);
  grpc_thread.join();
  {
    const std::scoped_lock lock(server_ctx.stop_mutex);
    server_ctx.server.reset();
  }
  pool.stop();
}

}  // namespace microbatch_server

auto
main(int argc, char* argv[]) -> int
{
  try {
    const microbatch_server::RuntimeConfig opts =
        microbatch_server::handle_program_arguments(
            {argv, static_cast<size_t>(argc)});
    const bool metrics_ok = microbatch_server::init_metrics(opts.metrics_port);
    if (!metrics_ok) {
      microbatch_server::log_warning(
          "Metrics server failed to start; continuing without metrics.");
    }
    microbatch_server::serve(opts);
    microbatch_server::shutdown_metrics();
  }
  catch (const microbatch_server::ClassifierException& e) {
    std::cerr << "\o{33}[1;31m[Classifier Error] " << e.what()
              << "\o{33}[0m\n";
    return 2;
  }
  catch (const std::exception& e) {
    std::cerr << "\o{33}[1;31m[General Error] " << e.what() << "\o{33}[0m\n";
    return -1;
  }

  return 0;
}
