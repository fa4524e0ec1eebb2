#pragma once

#include <httplib.h>

#include <atomic>
#include <string>
#include <thread>

#include "grpc/server/classifier_service.hpp"
#include "utils/logger.hpp"

namespace microbatch_server {

inline constexpr int kDefaultHttpThreads = 16;

struct HttpServerOptions {
  std::string host = "0.0.0.0";
  // 0 binds an ephemeral port.
  int port = 0;
  int threads = kDefaultHttpThreads;
  VerbosityLevel verbosity = VerbosityLevel::Info;
};

// Status code and JSON body of one GET /classify/<sentence> call.
struct HttpReply {
  int status = 200;
  std::string body;
};

// Runs one classification through the service and renders it as the HTTP
// reply: {class, sentence, confidence, processing_time, worker_id} on 200,
// {error} otherwise.
auto classify_http_reply(
    ClassifierServiceImpl& service, const std::string& sentence) -> HttpReply;

// =============================================================================
// ClassifyHttpServer
// -----------------------------------------------------------------------------
// cpp-httplib front end over the classifier service. Serves
// GET /classify/<sentence> and GET /bert/classify/<sentence>; the path segment
// arrives URL-decoded.
// =============================================================================
class ClassifyHttpServer {
 public:
  ClassifyHttpServer(ClassifierServiceImpl& service, HttpServerOptions options);
  ~ClassifyHttpServer();
  ClassifyHttpServer(const ClassifyHttpServer&) = delete;
  auto operator=(const ClassifyHttpServer&) -> ClassifyHttpServer& = delete;
  ClassifyHttpServer(ClassifyHttpServer&&) = delete;
  auto operator=(ClassifyHttpServer&&) -> ClassifyHttpServer& = delete;

  // Binds the socket and starts the listener thread. Returns false when the
  // address cannot be bound.
  auto start() -> bool;

  // Stops accepting connections and joins the listener. Idempotent.
  void stop();

  [[nodiscard]] auto port() const -> int { return port_; }

 private:
  void register_routes();

  ClassifierServiceImpl* service_;
  HttpServerOptions options_;
  httplib::Server server_;
  std::jthread listener_;
  std::atomic<bool> listening_{false};
  int port_ = -1;
};

}  // namespace microbatch_server
