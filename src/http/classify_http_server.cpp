#include "classify_http_server.hpp"

#include <json/json.h>

#include <algorithm>
#include <chrono>
#include <format>
#include <utility>

#include "grpc/http_status.hpp"

namespace microbatch_server {

namespace {

constexpr auto kStopPollInterval = std::chrono::milliseconds(1);

auto
to_compact_json(const Json::Value& value) -> std::string
{
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  return Json::writeString(builder, value);
}

void
set_json_response(httplib::Response& response, const HttpReply& reply)
{
  response.status = reply.status;
  response.set_content(reply.body, "application/json");
}

}  // namespace

auto
classify_http_reply(ClassifierServiceImpl& service, const std::string& sentence)
    -> HttpReply
{
  microbatch::ClassifyResponse reply;
  const grpc::Status status = service.classify(sentence, &reply);

  Json::Value body(Json::objectValue);
  if (status.ok()) {
    body["class"] = reply.label();
    body["sentence"] = reply.sentence();
    body["confidence"] = reply.confidence();
    body["processing_time"] = reply.processing_time();
    body["worker_id"] = reply.worker_id();
  } else {
    body["error"] = status.error_message();
  }
  return {to_http_status(status.error_code()), to_compact_json(body)};
}

ClassifyHttpServer::ClassifyHttpServer(
    ClassifierServiceImpl& service, HttpServerOptions options)
    : service_(&service), options_(std::move(options))
{
  const int threads = std::max(1, options_.threads);
  server_.new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  register_routes();
}

ClassifyHttpServer::~ClassifyHttpServer()
{
  stop();
}

void
ClassifyHttpServer::register_routes()
{
  const auto handler = [this](
                           const httplib::Request& request,
                           httplib::Response& response) {
    const std::string sentence = request.matches[1].str();
    const HttpReply reply = classify_http_reply(*service_, sentence);
    log_trace(
        options_.verbosity,
        std::format("GET {} -> {}", request.path, reply.status));
    set_json_response(response, reply);
  };
  server_.Get(R"(/classify/(.+))", handler);
  server_.Get(R"(/bert/classify/(.+))", handler);
}

auto
ClassifyHttpServer::start() -> bool
{
  if (listener_.joinable()) {
    return true;
  }
  if (options_.port == 0) {
    port_ = server_.bind_to_any_port(options_.host);
  } else if (server_.bind_to_port(options_.host, options_.port)) {
    port_ = options_.port;
  } else {
    port_ = -1;
  }
  if (port_ <= 0) {
    log_error(std::format(
        "Failed to bind HTTP server on {}:{}", options_.host, options_.port));
    return false;
  }

  listening_.store(true, std::memory_order_release);
  listener_ = std::jthread([this] {
    if (!server_.listen_after_bind()) {
      log_error("HTTP server stopped unexpectedly");
    }
    listening_.store(false, std::memory_order_release);
  });
  log_info(
      options_.verbosity,
      std::format("HTTP server listening on {}:{}", options_.host, port_));
  return true;
}

void
ClassifyHttpServer::stop()
{
  if (!listener_.joinable()) {
    return;
  }
  // stop() only takes effect once the accept loop is running.
  while (listening_.load(std::memory_order_acquire) && !server_.is_running()) {
    std::this_thread::sleep_for(kStopPollInterval);
  }
  server_.stop();
  listener_.join();
}

}  // namespace microbatch_server
