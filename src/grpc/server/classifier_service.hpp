#pragma once

#include <grpcpp/grpcpp.h>

#include <cstddef>
#include <memory>
#include <string>

#include "classifier.grpc.pb.h"
#include "core/dispatcher.hpp"
#include "core/worker_pool.hpp"
#include "grpc/http_status.hpp"
#include "signal_handler.hpp"
#include "utils/logger.hpp"

namespace microbatch_server {

class ClassifierServiceImpl final
    : public microbatch::ClassifierService::Service {
 public:
  ClassifierServiceImpl(
      Dispatcher& dispatcher, const WorkerPool& pool,
      VerbosityLevel verbosity = VerbosityLevel::Info);

  auto ServerLive(
      grpc::ServerContext* context,
      const microbatch::ServerLiveRequest* request,
      microbatch::ServerLiveResponse* reply) -> grpc::Status override;

  auto ServerReady(
      grpc::ServerContext* context,
      const microbatch::ServerReadyRequest* request,
      microbatch::ServerReadyResponse* reply) -> grpc::Status override;

  auto Classify(
      grpc::ServerContext* context, const microbatch::ClassifyRequest* request,
      microbatch::ClassifyResponse* reply) -> grpc::Status override;

  auto PoolStatus(
      grpc::ServerContext* context,
      const microbatch::PoolStatusRequest* request,
      microbatch::PoolStatusResponse* reply) -> grpc::Status override;

  // Runs one classification; shared by the RPC handler and tests.
  auto classify(const std::string& sentence, microbatch::ClassifyResponse* reply)
      -> grpc::Status;

 private:
  Dispatcher* dispatcher_;
  const WorkerPool* pool_;
  VerbosityLevel verbosity_;
};

struct GrpcServerOptions {
  std::string address;
  std::size_t max_message_bytes;
  VerbosityLevel verbosity;
};

// Blocks until the server is shut down through StopServer(). The started
// server is published into `context` under its stop mutex; a stop requested
// before that point shuts it down right away.
void RunGrpcServer(
    ClassifierServiceImpl& service, const GrpcServerOptions& options,
    ServerContext& context);

void StopServer(grpc::Server* server);
void StopServer(ServerContext& context);

}  // namespace microbatch_server
