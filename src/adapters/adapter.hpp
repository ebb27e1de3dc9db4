#pragma once

#include "call_context.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_transport.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct ChatTurn {
  std::string role;
  std::string content;
};

bool IsKnownRole(const std::string& role);

// Fails with kInvalidTurns on an empty list or an unrecognized role.
bool ValidateTurns(const std::vector<ChatTurn>& turns, GatewayError* err);

// Receives one text delta. Returning false stops the stream.
using DeltaCallback = std::function<bool(const std::string& delta)>;

// Uniform wrapper around one configured backend. Holds no per-call state, so
// one instance serves concurrent calls.
class ModelAdapter {
 public:
  ModelAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport);
  virtual ~ModelAdapter() = default;

  const std::string& Id() const { return config_.id; }
  const BackendConfig& Config() const { return config_; }
  virtual std::string Vendor() const = 0;

  std::optional<std::string> Generate(const std::string& prompt, const CallContext& ctx, GatewayError* err);
  bool GenerateStream(const std::string& prompt,
                      const CallContext& ctx,
                      const DeltaCallback& on_delta,
                      GatewayError* err);

  std::optional<std::string> Converse(const std::vector<ChatTurn>& turns, const CallContext& ctx, GatewayError* err);
  bool ConverseStream(const std::vector<ChatTurn>& turns,
                      const CallContext& ctx,
                      const DeltaCallback& on_delta,
                      GatewayError* err);

 protected:
  // Vendor translation. Turns are already validated.
  virtual std::optional<std::string> ChatOnce(const std::vector<ChatTurn>& turns,
                                              const CallContext& ctx,
                                              GatewayError* err) = 0;
  virtual bool ChatStream(const std::vector<ChatTurn>& turns,
                          const CallContext& ctx,
                          const DeltaCallback& on_delta,
                          GatewayError* err) = 0;

  // Posts a json body; on a non-2xx status fills *err with kBackend using the
  // vendor's error message when the body carries one.
  std::optional<HttpResponse> PostJson(const std::string& path,
                                       const RequestHeaderList& headers,
                                       const std::string& body,
                                       const CallContext& ctx,
                                       GatewayError* err);
  std::optional<HttpResponse> PostJsonStream(const std::string& path,
                                             const RequestHeaderList& headers,
                                             const std::string& body,
                                             const CallContext& ctx,
                                             const BodyCallback& on_bytes,
                                             GatewayError* err);

  std::string Tag(const std::string& path) const { return config_.id + ": " + path; }

  BackendConfig config_;
  std::shared_ptr<IHttpTransport> transport_;

 private:
  bool CheckStatus(const std::string& path, const HttpResponse& res, GatewayError* err) const;
  bool CheckContext(const CallContext& ctx, GatewayError* err) const;
};

// Pulls a human readable message out of a vendor error body.
std::string ExtractUpstreamError(const std::string& body);

}  // namespace gateway
