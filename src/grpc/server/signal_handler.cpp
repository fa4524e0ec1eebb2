#include "signal_handler.hpp"

namespace microbatch_server {

auto
server_context() -> ServerContext&
{
  static ServerContext ctx;
  return ctx;
}

// Only touches a lock-free atomic; the notifier thread in main wakes stop_cv.
void
signal_handler(int /*signal*/)
{
  server_context().stop_requested.store(true);
}

}  // namespace microbatch_server
