#include "classifier_service.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <format>
#include <limits>
#include <mutex>
#include <string>
#include <utility>

#include "utils/exceptions.hpp"
#include "utils/time_utils.hpp"

namespace microbatch_server {
using grpc::Server;
using grpc::ServerBuilder;
using grpc::Status;
using grpc::StatusCode;

ClassifierServiceImpl::ClassifierServiceImpl(
    Dispatcher& dispatcher, const WorkerPool& pool, VerbosityLevel verbosity)
    : dispatcher_(&dispatcher), pool_(&pool), verbosity_(verbosity)
{
}

auto
ClassifierServiceImpl::ServerLive(
    grpc::ServerContext* /*context*/, const microbatch::ServerLiveRequest* /*request*/,
    microbatch::ServerLiveResponse* reply) -> Status
{
  reply->set_live(true);
  return Status::OK;
}

auto
ClassifierServiceImpl::ServerReady(
    grpc::ServerContext* /*context*/,
    const microbatch::ServerReadyRequest* /*request*/,
    microbatch::ServerReadyResponse* reply) -> Status
{
  reply->set_ready(
      pool_->is_running() && !dispatcher_->is_shutdown() &&
      pool_->alive_count() > 0);
  return Status::OK;
}

auto
ClassifierServiceImpl::Classify(
    grpc::ServerContext* /*context*/, const microbatch::ClassifyRequest* request,
    microbatch::ClassifyResponse* reply) -> Status
{
  return classify(request->sentence(), reply);
}

auto
ClassifierServiceImpl::classify(
    const std::string& sentence, microbatch::ClassifyResponse* reply) -> Status
{
  const auto received = time_utils::SteadyClock::now();
  if (sentence.empty()) {
    return {StatusCode::INVALID_ARGUMENT, "Sentence must not be empty"};
  }

  ClassificationResponse response;
  try {
    response = dispatcher_->submit(sentence);
  }
  catch (const RequestTimeoutException& e) {
    return {StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  catch (const ServiceUnavailableException& e) {
    return {StatusCode::UNAVAILABLE, e.what()};
  }
  catch (const std::exception& e) {
    log_error(std::format("Error handling classification request: {}", e.what()));
    return {StatusCode::INTERNAL, e.what()};
  }

  if (!response.ok()) {
    return {
        response.unavailable ? StatusCode::UNAVAILABLE : StatusCode::INTERNAL,
        response.error.value_or("Inference produced no prediction")};
  }

  const auto& prediction = *response.prediction;
  reply->set_label(prediction.label);
  reply->set_sentence(sentence);
  reply->set_confidence(prediction.confidence);
  reply->set_processing_time(time_utils::elapsed_seconds_rounded(
      received, time_utils::SteadyClock::now()));
  reply->set_worker_id(response.worker_id);
  reply->set_class_index(prediction.class_index);
  for (const double probability : prediction.probabilities) {
    reply->add_probabilities(probability);
  }

  log_trace(
      verbosity_,
      std::format(
          "Classified '{}' as {} ({:.4f}) on worker {}", sentence,
          prediction.label, prediction.confidence, response.worker_id));
  return Status::OK;
}

auto
ClassifierServiceImpl::PoolStatus(
    grpc::ServerContext* /*context*/,
    const microbatch::PoolStatusRequest* /*request*/,
    microbatch::PoolStatusResponse* reply) -> Status
{
  for (const auto& worker : pool_->status()) {
    auto* entry = reply->add_workers();
    entry->set_id(worker.id);
    entry->set_core(worker.core ? static_cast<int>(*worker.core) : -1);
    entry->set_pinned(worker.pinned);
    entry->set_state(worker_state_name(worker.state));
    entry->set_restarts(worker.restarts);
    entry->set_retired(worker.retired);
  }
  reply->set_alive(static_cast<std::uint32_t>(pool_->alive_count()));
  reply->set_configured(static_cast<std::uint32_t>(pool_->worker_count()));
  reply->set_routing(routing_policy_name(pool_->routing()));
  return Status::OK;
}

namespace {
auto
configure_server_builder(
    ServerBuilder& builder, const GrpcServerOptions& options) -> void
{
  builder.AddListeningPort(options.address, grpc::InsecureServerCredentials());
  const int grpc_max_message_bytes =
      options.max_message_bytes >
              static_cast<std::size_t>(std::numeric_limits<int>::max())
          ? std::numeric_limits<int>::max()
          : static_cast<int>(options.max_message_bytes);
  builder.SetMaxReceiveMessageSize(grpc_max_message_bytes);
  builder.SetMaxSendMessageSize(grpc_max_message_bytes);
}
}  // namespace

void
RunGrpcServer(
    ClassifierServiceImpl& service, const GrpcServerOptions& options,
    ServerContext& context)
{
  ServerBuilder builder;
  configure_server_builder(builder, options);
  builder.RegisterService(&service);

  auto server = builder.BuildAndStart();
  if (!server) {
    log_error(
        std::format("Failed to start gRPC server on {}", options.address));
    return;
  }
  Server* started = server.get();
  bool stop_already_requested = false;
  {
    const std::scoped_lock lock(context.stop_mutex);
    context.server = std::move(server);
    stop_already_requested = context.stop_requested.load();
  }
  if (stop_already_requested) {
    started->Shutdown();
  } else {
    log_info(
        options.verbosity,
        std::format("Server listening on {}", options.address));
  }
  started->Wait();
}

void
StopServer(Server* server)
{
  if (server != nullptr) {
    server->Shutdown();
  }
}

void
StopServer(ServerContext& context)
{
  Server* server = nullptr;
  {
    const std::scoped_lock lock(context.stop_mutex);
    server = context.server.get();
  }
  StopServer(server);
}

}  // namespace microbatch_server
