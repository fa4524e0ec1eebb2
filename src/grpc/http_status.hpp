#pragma once

#include <grpcpp/support/status.h>

namespace microbatch_server {

// HTTP status of a classification outcome: 200, 400, 408, 503 or 500.
auto to_http_status(grpc::StatusCode code) -> int;

}  // namespace microbatch_server
