#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <format>
#include <functional>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include "logger.hpp"
#include "transparent_hash.hpp"

namespace microbatch_server {

namespace {

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

auto
post_parse_hook_storage() -> ConfigLoaderPostParseHook&
{
  static ConfigLoaderPostParseHook hook;
  return hook;
}

auto
post_parse_hook_mutex() -> std::mutex&
{
  static std::mutex mutex;
  return mutex;
}

void
invoke_post_parse_hook(RuntimeConfig& cfg)
{
  ConfigLoaderPostParseHook hook;
  {
    const std::scoped_lock lock(post_parse_hook_mutex());
    hook = post_parse_hook_storage();
  }
  if (hook) {
    hook(cfg);
  }
}

auto
read_positive_ms(const YAML::Node& root, std::string_view key)
    -> std::chrono::milliseconds
{
  const int value = root[std::string(key)].as<int>();
  if (value <= 0) {
    throw std::invalid_argument(std::format("{} must be > 0", key));
  }
  return std::chrono::milliseconds(value);
}

void
parse_verbosity(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["verbose"]) {
    cfg.verbosity = parse_verbosity_level(root["verbose"].as<std::string>());
  } else if (root["verbosity"]) {
    cfg.verbosity = parse_verbosity_level(root["verbosity"].as<std::string>());
  }
}

auto
validate_allowed_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  static const std::unordered_set<
      std::string, TransparentHash, std::equal_to<>>
      kAllowedKeys{
          "name",
          "verbose",
          "verbosity",
          "model",
          "labels",
          "address",
          "metrics_port",
          "max_message_bytes",
          "http_host",
          "http_port",
          "http_threads",
          "workers",
          "routing",
          "pin_workers",
          "core_ids",
          "intra_op_threads",
          "max_batch_size",
          "max_batch_delay_ms",
          "worker_poll_interval_ms",
          "request_timeout_ms",
          "dispatcher_poll_interval_ms",
          "health_check_interval_ms",
          "worker_stall_timeout_ms",
          "max_worker_restarts"};

  for (const auto& kvalue : root) {
    if (!kvalue.first.IsScalar()) {
      log_error("Configuration keys must be scalar strings");
      cfg.valid = false;
      continue;
    }
    const auto key = kvalue.first.as<std::string>();
    if (!kAllowedKeys.contains(key)) {
      log_error(std::string("Unknown configuration option: ") + key);
      cfg.valid = false;
    }
  }
  return cfg.valid;
}

auto
validate_required_keys(const YAML::Node& root, RuntimeConfig& cfg) -> bool
{
  if (!root["model"]) {
    log_error("Missing required key: model");
    cfg.valid = false;
  }
  return cfg.valid;
}

void
parse_model_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["name"]) {
    cfg.name = root["name"].as<std::string>();
  }
  if (root["model"]) {
    cfg.model.path = root["model"].as<std::string>();
    if (!std::filesystem::exists(cfg.model.path)) {
      log_error(std::string("Model path does not exist: ") + cfg.model.path);
      cfg.valid = false;
    }
  }
  if (root["labels"]) {
    const YAML::Node labels = root["labels"];
    if (!labels.IsSequence() || labels.size() == 0) {
      throw std::invalid_argument("labels must be a non-empty sequence");
    }
    auto parsed = labels.as<std::vector<std::string>>();
    std::unordered_set<std::string, TransparentHash, std::equal_to<>>
        seen;
    for (const auto& label : parsed) {
      if (label.empty()) {
        throw std::invalid_argument("labels must not contain empty names");
      }
      if (!seen.insert(label).second) {
        throw std::invalid_argument(
            std::format("labels contains duplicate entry '{}'", label));
      }
    }
    cfg.model.labels = std::move(parsed);
  }
  if (root["intra_op_threads"]) {
    cfg.model.intra_op_threads = root["intra_op_threads"].as<int>();
    if (cfg.model.intra_op_threads <= 0) {
      throw std::invalid_argument("intra_op_threads must be > 0");
    }
  }
}

void
parse_network_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["address"]) {
    cfg.server_address = root["address"].as<std::string>();
    if (cfg.server_address.empty()) {
      log_error("address must not be empty");
      cfg.valid = false;
    }
  }
  if (root["metrics_port"]) {
    cfg.metrics_port = root["metrics_port"].as<int>();
    if (cfg.metrics_port < kMinPort || cfg.metrics_port > kMaxPort) {
      log_error("metrics_port must be between 1 and 65535");
      cfg.valid = false;
    }
  }
  if (root["max_message_bytes"]) {
    const auto tmp = root["max_message_bytes"].as<long long>();
    if (tmp <= 0 || tmp > std::numeric_limits<int>::max()) {
      throw std::invalid_argument(
          "max_message_bytes must be > 0 and fit in a 32-bit int");
    }
    cfg.max_message_bytes = static_cast<std::size_t>(tmp);
  }
  if (root["http_host"]) {
    cfg.http.host = root["http_host"].as<std::string>();
    if (cfg.http.host.empty()) {
      log_error("http_host must not be empty");
      cfg.valid = false;
    }
  }
  if (root["http_port"]) {
    cfg.http.port = root["http_port"].as<int>();
    if (cfg.http.port < 0 || cfg.http.port > kMaxPort) {
      log_error("http_port must be between 0 and 65535");
      cfg.valid = false;
    }
  }
  if (root["http_threads"]) {
    cfg.http.threads = root["http_threads"].as<int>();
    if (cfg.http.threads <= 0) {
      throw std::invalid_argument("http_threads must be > 0");
    }
  }
}

void
parse_pool_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["workers"]) {
    cfg.pool.worker_count = root["workers"].as<int>();
    if (cfg.pool.worker_count <= 0 ||
        cfg.pool.worker_count > kMaxWorkerCount) {
      throw std::invalid_argument(
          std::format("workers must be between 1 and {}", kMaxWorkerCount));
    }
  }
  if (root["routing"]) {
    const auto routing = root["routing"].as<std::string>();
    if (routing == "shared") {
      cfg.pool.routing = RoutingPolicy::Shared;
    } else if (routing == "round_robin") {
      cfg.pool.routing = RoutingPolicy::RoundRobin;
    } else {
      log_error(std::string("Unknown routing policy: ") + routing);
      cfg.valid = false;
    }
  }
  if (root["pin_workers"]) {
    cfg.pool.pin_workers = root["pin_workers"].as<bool>();
  }
  if (root["core_ids"]) {
    if (!root["core_ids"].IsSequence()) {
      throw std::invalid_argument("core_ids must be a sequence");
    }
    cfg.pool.core_ids = root["core_ids"].as<std::vector<int>>();
    for (const int core : cfg.pool.core_ids) {
      if (core < 0) {
        throw std::invalid_argument("core_ids must be >= 0");
      }
    }
  }
  if (root["health_check_interval_ms"]) {
    cfg.pool.health_check_interval =
        read_positive_ms(root, "health_check_interval_ms");
  }
  if (root["worker_stall_timeout_ms"]) {
    cfg.pool.stall_timeout = read_positive_ms(root, "worker_stall_timeout_ms");
  }
  if (root["max_worker_restarts"]) {
    cfg.pool.max_restarts = root["max_worker_restarts"].as<int>();
    if (cfg.pool.max_restarts < 0) {
      throw std::invalid_argument("max_worker_restarts must be >= 0");
    }
  }
}

void
parse_batching_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["max_batch_size"]) {
    cfg.batching.max_batch_size = root["max_batch_size"].as<int>();
    if (cfg.batching.max_batch_size <= 0 ||
        cfg.batching.max_batch_size > kMaxBatchSizeLimit) {
      throw std::invalid_argument(std::format(
          "max_batch_size must be between 1 and {}", kMaxBatchSizeLimit));
    }
  }
  if (root["max_batch_delay_ms"]) {
    const int delay = root["max_batch_delay_ms"].as<int>();
    if (delay < 0) {
      throw std::invalid_argument("max_batch_delay_ms must be >= 0");
    }
    cfg.batching.max_batch_delay = std::chrono::milliseconds(delay);
  }
  if (root["worker_poll_interval_ms"]) {
    cfg.batching.poll_interval =
        read_positive_ms(root, "worker_poll_interval_ms");
  }
}

void
parse_dispatcher_nodes(const YAML::Node& root, RuntimeConfig& cfg)
{
  if (root["request_timeout_ms"]) {
    cfg.dispatcher.request_timeout =
        read_positive_ms(root, "request_timeout_ms");
  }
  if (root["dispatcher_poll_interval_ms"]) {
    cfg.dispatcher.poll_interval =
        read_positive_ms(root, "dispatcher_poll_interval_ms");
  }
}

void
validate_cross_field_constraints(RuntimeConfig& cfg)
{
  if (!cfg.pool.core_ids.empty() &&
      cfg.pool.core_ids.size() <
          static_cast<std::size_t>(cfg.pool.worker_count)) {
    log_error(std::format(
        "core_ids lists {} cores but {} workers are configured",
        cfg.pool.core_ids.size(), cfg.pool.worker_count));
    cfg.valid = false;
  }
  if (cfg.http.port != 0 && cfg.http.port == cfg.metrics_port) {
    log_error(std::format(
        "http_port and metrics_port both use port {}", cfg.http.port));
    cfg.valid = false;
  }
  if (cfg.dispatcher.poll_interval > cfg.dispatcher.request_timeout) {
    log_warning(
        "dispatcher_poll_interval_ms exceeds request_timeout_ms; timeouts "
        "will be detected late");
  }
}

}  // namespace

void
set_config_loader_post_parse_hook(ConfigLoaderPostParseHook hook)
{
  const std::scoped_lock lock(post_parse_hook_mutex());
  post_parse_hook_storage() = std::move(hook);
}

void
reset_config_loader_post_parse_hook()
{
  const std::scoped_lock lock(post_parse_hook_mutex());
  post_parse_hook_storage() = nullptr;
}

auto
load_config(const std::string& path) -> RuntimeConfig
{
  RuntimeConfig cfg;
  cfg.config_path = path;
  const auto mark_invalid = [&cfg](const std::string& message) {
    log_error(std::string("Failed to load config: ") + message);
    cfg.valid = false;
  };
  try {
    YAML::Node root = YAML::LoadFile(path);
    if (!root || !root.IsMap()) {
      log_error("Config root must be a mapping");
      cfg.valid = false;
      return cfg;
    }

    parse_verbosity(root, cfg);
    if (!validate_allowed_keys(root, cfg)) {
      return cfg;
    }
    if (!validate_required_keys(root, cfg)) {
      return cfg;
    }
    parse_model_nodes(root, cfg);
    parse_network_nodes(root, cfg);
    parse_pool_nodes(root, cfg);
    parse_batching_nodes(root, cfg);
    parse_dispatcher_nodes(root, cfg);
    invoke_post_parse_hook(cfg);
    validate_cross_field_constraints(cfg);
  }
  catch (const YAML::Exception& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::invalid_argument& exception) {
    mark_invalid(exception.what());
  }
  catch (const std::filesystem::filesystem_error& exception) {
    mark_invalid(exception.what());
  }
  return cfg;
}

}  // namespace microbatch_server
