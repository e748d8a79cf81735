#pragma once
#include <string>

namespace lsdb {
  class ActionDispatcher;

  // Start a blocking HTTP server speaking the SimpleDB query protocol on "/".
  // Returns false when the address cannot be bound.
  bool run_http_server(ActionDispatcher& dispatcher,
                       const std::string& bindAddr,
                       int port);
}
