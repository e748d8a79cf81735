#include "HttpServer.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <string>

#include "services/api/ActionDispatcher.hpp"

// -------- helpers --------

// Query string and form-encoded body both land in req.params; first value wins.
static lsdb::ParamMap to_param_map(const httplib::Request& req) {
  lsdb::ParamMap params;
  for (const auto& [k, v] : req.params) params.emplace(k, v);
  return params;
}

// -------- server --------

namespace lsdb {

bool run_http_server(ActionDispatcher& dispatcher,
                     const std::string& bindAddr,
                     int port) {
  httplib::Server svr;

  // Health check
  svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    res.status = 200;
    res.set_content("ok", "text/plain");
  });

  // GET /?Action=...&DomainName=...   or   POST / with a form-encoded body
  auto handler = [&](const httplib::Request& req, httplib::Response& res) {
    DispatchResult out = dispatcher.dispatch(to_param_map(req));
    res.status = out.status;
    res.set_content(out.body, out.contentType.c_str());
  };
  svr.Get("/", handler);
  svr.Post("/", handler);

  // Fallback
  svr.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (res.status == 404) res.set_content("not found", "text/plain");
  });

  spdlog::info("SimpleDB emulator listening on http://{}:{}", bindAddr, port);
  if (!svr.listen(bindAddr.c_str(), port)) {
    spdlog::error("Failed to bind {}:{}", bindAddr, port);
    return false;
  }
  return true;
}

} // namespace lsdb
