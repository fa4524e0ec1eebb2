#include "client_args.hpp"

#include <format>
#include <functional>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "utils/logger.hpp"
#include "utils/transparent_hash.hpp"

namespace microbatch_server {

void
display_client_help(const char* prog_name)
{
  std::cout
      << "Usage: " << prog_name << " [OPTIONS]\n"
      << "  --server ADDR       gRPC server address (default: localhost:50051)\n"
      << "  --sentence TEXT     Sentence to classify (may be repeated, "
         "default: Hello)\n"
      << "  --request-number N  Times each sentence is sent (default: 1)\n"
      << "  --concurrency C     Parallel client threads (default: 1)\n"
      << "  --timeout-ms T      Per-request deadline in ms (default: 35000)\n"
      << "  --status            Print the worker pool status and exit\n"
      << "  --verbose [0-4]     Verbosity level: 0=silent to 4=trace\n"
      << "  --help              Show this help message\n";
}

// =============================================================================
// Argument Parsing Utilities
// =============================================================================

namespace {

template <typename Func>
auto
try_parse(const char* val, Func&& parser) -> bool
{
  try {
    std::forward<Func>(parser)(val);
    return true;
  }
  catch (const std::invalid_argument& e) {
    log_error(std::format("Invalid value: {}", e.what()));
    return false;
  }
  catch (const std::out_of_range& e) {
    log_error(std::format("Value out of range: {}", e.what()));
    return false;
  }
}

template <typename Func>
auto
expect_and_parse(size_t& idx, std::span<const char*> args, Func&& parser)
    -> bool
{
  if (idx + 1 >= args.size()) {
    log_error(std::format("Missing value for {}", args[idx]));
    return false;
  }
  ++idx;
  return try_parse(args[idx], std::forward<Func>(parser));
}

auto
parse_positive(const char* val) -> int
{
  const int tmp = std::stoi(val);
  if (tmp <= 0) {
    throw std::invalid_argument("Must be > 0.");
  }
  return tmp;
}

// =============================================================================
// Individual Argument Parsers
// =============================================================================

auto
parse_server(ClientConfig& cfg, size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(
      idx, args, [&cfg](const char* val) { cfg.server_address = val; });
}

auto
parse_sentence(ClientConfig& cfg, size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(idx, args, [&cfg](const char* val) {
    std::string sentence(val);
    if (sentence.empty()) {
      throw std::invalid_argument("Sentence must not be empty.");
    }
    cfg.sentences.push_back(std::move(sentence));
  });
}

auto
parse_request_nb(ClientConfig& cfg, size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(idx, args, [&cfg](const char* val) {
    cfg.request_nb = parse_positive(val);
  });
}

auto
parse_concurrency(ClientConfig& cfg, size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(idx, args, [&cfg](const char* val) {
    cfg.concurrency = parse_positive(val);
  });
}

auto
parse_timeout(ClientConfig& cfg, size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(idx, args, [&cfg](const char* val) {
    cfg.timeout_ms = parse_positive(val);
  });
}

auto
parse_verbose(ClientConfig& cfg, size_t& idx, std::span<const char*> args)
    -> bool
{
  return expect_and_parse(idx, args, [&cfg](const char* val) {
    cfg.verbosity = parse_verbosity_level(val);
  });
}

// =============================================================================
// Dispatch Argument Parser (Main parser loop)
// =============================================================================

auto
parse_argument_values(std::span<const char*> args_span, ClientConfig& cfg)
    -> bool
{
  static const std::unordered_map<
      std::string, bool (*)(ClientConfig&, size_t&, std::span<const char*>),
      TransparentHash, std::equal_to<>>
      dispatch = {
          {"--server", parse_server},
          {"--sentence", parse_sentence},
          {"--request-number", parse_request_nb},
          {"--concurrency", parse_concurrency},
          {"--timeout-ms", parse_timeout},
          {"--verbose", parse_verbose},
      };

  for (size_t idx = 1; idx < args_span.size(); ++idx) {
    const std::string arg = args_span[idx];

    if (arg == "--help" || arg == "-h") {
      cfg.show_help = true;
      return true;
    }
    if (arg == "--status") {
      cfg.pool_status = true;
      continue;
    }

    if (auto iter = dispatch.find(arg); iter != dispatch.end()) {
      if (!iter->second(cfg, idx, args_span)) {
        return false;
      }
      continue;
    }

    log_error(std::format(
        "Unknown argument: {}. Use --help to see valid options.", arg));
    return false;
  }

  return true;
}

}  // namespace

// =============================================================================
// Top-Level Entry
// =============================================================================

auto
parse_client_args(const std::span<const char*> args) -> ClientConfig
{
  ClientConfig cfg;

  if (!parse_argument_values(args, cfg)) {
    cfg.valid = false;
    return cfg;
  }

  if (cfg.sentences.empty()) {
    cfg.sentences.emplace_back("Hello");
  }

  return cfg;
}

}  // namespace microbatch_server
