#pragma once

#include <span>
#include <string>
#include <vector>

#include "utils/logger.hpp"

namespace microbatch_server {

inline constexpr int kDefaultClientTimeoutMs = 35000;

struct ClientConfig {
  std::string server_address = "localhost:50051";
  std::vector<std::string> sentences;
  int request_nb = 1;
  int concurrency = 1;
  int timeout_ms = kDefaultClientTimeoutMs;
  VerbosityLevel verbosity = VerbosityLevel::Info;
  bool pool_status = false;
  bool show_help = false;
  bool valid = true;
};

void display_client_help(const char* prog_name);
auto parse_client_args(std::span<const char*> args) -> ClientConfig;

}  // namespace microbatch_server
