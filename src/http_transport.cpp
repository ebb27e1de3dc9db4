#include "http_transport.hpp"

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <utility>

namespace gateway {
namespace {

constexpr long long kMaxReadTimeoutMs = 300 * 1000;
constexpr long long kWriteTimeoutMs = 30 * 1000;

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, const CallContext& ctx, int connect_ms) {
  const std::string url = ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port);
  auto cli = std::make_unique<httplib::Client>(url);
  const long long remaining = std::max<long long>(ctx.RemainingMs(), 1);
  cli->set_connection_timeout(std::chrono::milliseconds(std::min<long long>(connect_ms, remaining)));
  cli->set_read_timeout(std::chrono::milliseconds(std::min(kMaxReadTimeoutMs, remaining)));
  cli->set_write_timeout(std::chrono::milliseconds(std::min(kWriteTimeoutMs, remaining)));
  return cli;
}

static void FailFromContext(const CallContext& ctx, const std::string& what, GatewayError* err) {
  if (ctx.cancel.IsCancelled()) {
    SetError(err, ErrorKind::kCancelled, "request cancelled");
  } else if (ctx.Expired()) {
    SetError(err, ErrorKind::kTimeout, "deadline exceeded");
  } else {
    SetError(err, ErrorKind::kBackend, what);
  }
}

}  // namespace

std::string JoinPath(const std::string& base, const std::string& path) {
  if (base.empty()) return path;
  if (base.back() == '/' && !path.empty() && path.front() == '/') return base + path.substr(1);
  if (base.back() != '/' && !path.empty() && path.front() != '/') return base + "/" + path;
  return base + path;
}

std::optional<HttpResponse> HttplibTransport::Post(const HttpEndpoint& endpoint,
                                                   const HttpRequest& req,
                                                   const CallContext& ctx,
                                                   GatewayError* err) {
  return Send(endpoint, req, ctx, nullptr, err);
}

std::optional<HttpResponse> HttplibTransport::PostStream(const HttpEndpoint& endpoint,
                                                         const HttpRequest& req,
                                                         const CallContext& ctx,
                                                         const BodyCallback& on_bytes,
                                                         GatewayError* err) {
  return Send(endpoint, req, ctx, &on_bytes, err);
}

std::optional<HttpResponse> HttplibTransport::Send(const HttpEndpoint& endpoint,
                                                   const HttpRequest& req,
                                                   const CallContext& ctx,
                                                   const BodyCallback* on_bytes,
                                                   GatewayError* err) {
  if (ctx.cancel.IsCancelled() || ctx.Expired()) {
    FailFromContext(ctx, "request not started", err);
    return std::nullopt;
  }

  auto cli = MakeClient(endpoint, ctx, connect_timeout_ms_);
  if (!cli->is_valid()) {
    SetError(err, ErrorKind::kBackend, endpoint.scheme + "://" + endpoint.host + ": unsupported endpoint");
    return std::nullopt;
  }

  // Closes the socket so a blocked read returns promptly. Declared after cli:
  // its destructor waits out a running stop() before cli is freed.
  httplib::Client* raw = cli.get();
  ScopedCancelCallback stop_on_cancel(ctx.cancel, [raw]() { raw->stop(); });

  HttpResponse out;
  bool stopped_by_callback = false;

  httplib::Request r;
  r.method = "POST";
  r.path = JoinPath(endpoint.base_path, req.path);
  for (const auto& kv : req.headers) r.headers.emplace(kv.first, kv.second);
  r.headers.emplace("Content-Type", req.content_type);
  r.body = req.body;
  r.response_handler = [&](const httplib::Response& res) {
    out.status = res.status;
    return true;
  };
  r.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) -> bool {
    if (ctx.cancel.IsCancelled() || ctx.Expired()) return false;
    if (on_bytes && IsSuccessStatus(out.status)) {
      if (!(*on_bytes)(data, len)) {
        stopped_by_callback = true;
        return false;
      }
      return true;
    }
    out.body.append(data, len);
    return true;
  };

  auto result = cli->send(r);
  if (!result) {
    if (stopped_by_callback) {
      SetError(err, ErrorKind::kCancelled, "stream consumer stopped");
      return std::nullopt;
    }
    FailFromContext(ctx, endpoint.host + ": " + httplib::to_string(result.error()), err);
    return std::nullopt;
  }
  out.status = result->status;
  return out;
}

}  // namespace gateway
