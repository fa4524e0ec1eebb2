#include "classifier_client.hpp"

#include <json/json.h>

#include <format>
#include <memory>
#include <string>

#include "grpc/http_status.hpp"
#include "utils/time_utils.hpp"

namespace microbatch_server {

namespace {
auto
to_compact_json(const Json::Value& value) -> std::string
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}
}  // namespace

ClassifierClient::ClassifierClient(
    const std::shared_ptr<grpc::Channel>& channel, VerbosityLevel verbosity)
    : stub_(microbatch::ClassifierService::NewStub(channel)),
      verbosity_(verbosity)
{
}

auto
ClassifierClient::ServerIsLive() -> bool
{
  const microbatch::ServerLiveRequest request;
  microbatch::ServerLiveResponse response;
  grpc::ClientContext context;

  const grpc::Status status = stub_->ServerLive(&context, request, &response);
  if (!status.ok()) {
    log_error(std::format("RPC failed: {}", status.error_message()));
    return false;
  }

  log_info(
      verbosity_,
      std::format("Server live: {}", response.live() ? "true" : "false"));
  return response.live();
}

auto
ClassifierClient::ServerIsReady() -> bool
{
  const microbatch::ServerReadyRequest request;
  microbatch::ServerReadyResponse response;
  grpc::ClientContext context;

  const grpc::Status status = stub_->ServerReady(&context, request, &response);
  if (!status.ok()) {
    log_error(std::format("RPC failed: {}", status.error_message()));
    return false;
  }

  log_info(
      verbosity_,
      std::format("Server ready: {}", response.ready() ? "true" : "false"));
  return response.ready();
}

auto
ClassifierClient::Classify(
    const std::string& sentence, std::chrono::milliseconds timeout)
    -> ClassifyOutcome
{
  microbatch::ClassifyRequest request;
  request.set_sentence(sentence);

  grpc::ClientContext context;
  context.set_deadline(std::chrono::system_clock::now() + timeout);

  ClassifyOutcome outcome;
  const auto start = time_utils::SteadyClock::now();
  outcome.status = stub_->Classify(&context, request, &outcome.reply);
  outcome.roundtrip_ms =
      time_utils::elapsed_ms(start, time_utils::SteadyClock::now());

  log_debug(
      verbosity_,
      std::format(
          "Classify '{}' -> {} in {:.3f} ms", sentence,
          outcome.status.ok() ? outcome.reply.label()
                              : outcome.status.error_message(),
          outcome.roundtrip_ms));
  return outcome;
}

auto
ClassifierClient::PoolStatus() -> std::optional<microbatch::PoolStatusResponse>
{
  const microbatch::PoolStatusRequest request;
  microbatch::PoolStatusResponse response;
  grpc::ClientContext context;

  const grpc::Status status = stub_->PoolStatus(&context, request, &response);
  if (!status.ok()) {
    log_error(std::format("RPC failed: {}", status.error_message()));
    return std::nullopt;
  }
  return response;
}

auto
format_outcome_json(const std::string& sentence, const ClassifyOutcome& outcome)
    -> std::string
{
  Json::Value root(Json::objectValue);
  root["status"] = to_http_status(outcome.status.error_code());

  if (outcome.status.ok()) {
    const auto& reply = outcome.reply;
    root["class"] = reply.label();
    root["sentence"] = reply.sentence();
    root["confidence"] = reply.confidence();
    root["processing_time"] = reply.processing_time();
    root["worker_id"] = reply.worker_id();
  } else {
    root["sentence"] = sentence;
    root["error"] = outcome.status.error_message();
  }
  return to_compact_json(root);
}

auto
format_pool_status_json(const microbatch::PoolStatusResponse& status)
    -> std::string
{
  Json::Value root(Json::objectValue);
  root["alive"] = status.alive();
  root["configured"] = status.configured();
  root["routing"] = status.routing();

  Json::Value workers(Json::arrayValue);
  for (const auto& worker : status.workers()) {
    Json::Value entry(Json::objectValue);
    entry["id"] = worker.id();
    entry["core"] = worker.core();
    entry["pinned"] = worker.pinned();
    entry["state"] = worker.state();
    entry["restarts"] = worker.restarts();
    entry["retired"] = worker.retired();
    workers.append(entry);
  }
  root["workers"] = workers;
  return to_compact_json(root);
}

}  // namespace microbatch_server
