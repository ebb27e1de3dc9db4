#pragma once

#include "call_context.hpp"
#include "config.hpp"
#include "errors.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace gateway {

struct HttpRequest {
  // Appended to the endpoint's base path.
  std::string path;
  RequestHeaderList headers;
  std::string body;
  std::string content_type = "application/json";
};

struct HttpResponse {
  int status = 0;
  // Empty for a successful streamed response: its bytes went to the callback.
  std::string body;
};

using BodyCallback = std::function<bool(const char* data, std::size_t len)>;

// The transport capability adapters depend on. Implementations honor the
// context deadline and abort when its token is cancelled. Failures to obtain a
// response map to kBackend (status 0), kTimeout or kCancelled.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  virtual std::optional<HttpResponse> Post(const HttpEndpoint& endpoint,
                                           const HttpRequest& req,
                                           const CallContext& ctx,
                                           GatewayError* err) = 0;

  // Bytes of a 2xx body are passed to on_bytes as they arrive; returning false
  // aborts the request with kCancelled. Non-2xx bodies are buffered into the
  // returned response.
  virtual std::optional<HttpResponse> PostStream(const HttpEndpoint& endpoint,
                                                 const HttpRequest& req,
                                                 const CallContext& ctx,
                                                 const BodyCallback& on_bytes,
                                                 GatewayError* err) = 0;
};

class HttplibTransport : public IHttpTransport {
 public:
  explicit HttplibTransport(int connect_timeout_ms = 5000) : connect_timeout_ms_(connect_timeout_ms) {}

  std::optional<HttpResponse> Post(const HttpEndpoint& endpoint,
                                   const HttpRequest& req,
                                   const CallContext& ctx,
                                   GatewayError* err) override;
  std::optional<HttpResponse> PostStream(const HttpEndpoint& endpoint,
                                         const HttpRequest& req,
                                         const CallContext& ctx,
                                         const BodyCallback& on_bytes,
                                         GatewayError* err) override;

 private:
  std::optional<HttpResponse> Send(const HttpEndpoint& endpoint,
                                   const HttpRequest& req,
                                   const CallContext& ctx,
                                   const BodyCallback* on_bytes,
                                   GatewayError* err);

  int connect_timeout_ms_;
};

std::string JoinPath(const std::string& base, const std::string& path);

inline bool IsSuccessStatus(int status) {
  return status >= 200 && status < 300;
}

}  // namespace gateway
