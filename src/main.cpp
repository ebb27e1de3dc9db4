#include "adapters/adapter_factory.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "gateway_router.hpp"
#include "http_transport.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

int main() {
  std::cout.setf(std::ios::unitbuf);

  std::string err;
  auto cfg = gateway::LoadConfigFromEnv(&err);
  if (!cfg) {
    std::cerr << "[config] " << err << "\n";
    return 1;
  }
  std::cout << "[config] models=" << cfg->models.size() << " default_timeout_ms=" << cfg->default_timeout_ms << "\n";

  auto transport = std::make_shared<gateway::HttplibTransport>();
  auto registry = gateway::BuildRegistry(cfg->models, transport, &err);
  if (!registry) {
    std::cerr << "[registry] " << err << "\n";
    return 1;
  }

  gateway::Dispatcher dispatcher(registry.get(), std::chrono::milliseconds(cfg->default_timeout_ms));
  gateway::GatewayRouter router(&dispatcher);

  httplib::Server server;
  router.Register(&server);

  server.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["models"] = registry->size();
    j["unix_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    res.status = 200;
    res.set_content(j.dump(), "application/json");
  });

  server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] " << req.method << " " << req.path << " failed: " << message << "\n";
    nlohmann::json j;
    j["error"] = {{"kind", "internal"}, {"message", message}};
    res.status = 500;
    res.set_content(j.dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    if (res.status == 404) {
      message = "not found";
    } else if (res.status >= 500) {
      message = "internal error";
    } else {
      message = "bad request";
    }
    nlohmann::json j;
    j["error"] = {{"kind", "http"}, {"message", message}};
    res.set_content(j.dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(60);
  server.set_write_timeout(60);

  std::cout << "[http] listen host=" << cfg->listen.host << " port=" << cfg->listen.port << "\n";
  const bool ok = server.listen(cfg->listen.host, cfg->listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
