#pragma once

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "classifier.grpc.pb.h"
#include "utils/logger.hpp"

namespace microbatch_server {

struct ClassifyOutcome {
  grpc::Status status;
  microbatch::ClassifyResponse reply;
  double roundtrip_ms = 0.0;
};

class ClassifierClient {
 public:
  ClassifierClient(
      const std::shared_ptr<grpc::Channel>& channel, VerbosityLevel verbosity);

  auto ServerIsLive() -> bool;
  auto ServerIsReady() -> bool;
  auto Classify(const std::string& sentence, std::chrono::milliseconds timeout)
      -> ClassifyOutcome;
  auto PoolStatus() -> std::optional<microbatch::PoolStatusResponse>;

 private:
  std::unique_ptr<microbatch::ClassifierService::Stub> stub_;
  VerbosityLevel verbosity_;
};

// One JSON object per outcome: the HTTP-compatible status plus either the
// classification body or {"error": ...}.
auto format_outcome_json(
    const std::string& sentence, const ClassifyOutcome& outcome)
    -> std::string;

auto format_pool_status_json(const microbatch::PoolStatusResponse& status)
    -> std::string;

}  // namespace microbatch_server
