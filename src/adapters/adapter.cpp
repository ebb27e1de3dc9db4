#include "adapters/adapter.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace gateway {
namespace {

constexpr size_t kMaxErrorBody = 512;

static std::string Truncate(std::string s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  s.resize(max_chars);
  s += "...(truncated)";
  return s;
}

}  // namespace

bool IsKnownRole(const std::string& role) {
  return role == "system" || role == "user" || role == "assistant";
}

bool ValidateTurns(const std::vector<ChatTurn>& turns, GatewayError* err) {
  if (turns.empty()) {
    SetError(err, ErrorKind::kInvalidTurns, "conversation has no turns");
    return false;
  }
  for (size_t i = 0; i < turns.size(); i++) {
    if (!IsKnownRole(turns[i].role)) {
      SetError(err, ErrorKind::kInvalidTurns,
               "turn " + std::to_string(i) + " has unrecognized role '" + turns[i].role + "'");
      return false;
    }
  }
  return true;
}

std::string ExtractUpstreamError(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object()) {
    if (j.contains("error")) {
      const auto& e = j["error"];
      if (e.is_string()) return e.get<std::string>();
      if (e.is_object() && e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
    }
    if (j.contains("message") && j["message"].is_string()) return j["message"].get<std::string>();
  }
  return Truncate(body, kMaxErrorBody);
}

ModelAdapter::ModelAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

std::optional<std::string> ModelAdapter::Generate(const std::string& prompt, const CallContext& ctx, GatewayError* err) {
  return Converse({ChatTurn{"user", prompt}}, ctx, err);
}

bool ModelAdapter::GenerateStream(const std::string& prompt,
                                  const CallContext& ctx,
                                  const DeltaCallback& on_delta,
                                  GatewayError* err) {
  return ConverseStream({ChatTurn{"user", prompt}}, ctx, on_delta, err);
}

std::optional<std::string> ModelAdapter::Converse(const std::vector<ChatTurn>& turns,
                                                  const CallContext& ctx,
                                                  GatewayError* err) {
  if (!ValidateTurns(turns, err)) return std::nullopt;
  if (!CheckContext(ctx, err)) return std::nullopt;
  return ChatOnce(turns, ctx, err);
}

bool ModelAdapter::ConverseStream(const std::vector<ChatTurn>& turns,
                                  const CallContext& ctx,
                                  const DeltaCallback& on_delta,
                                  GatewayError* err) {
  if (!ValidateTurns(turns, err)) return false;
  if (!CheckContext(ctx, err)) return false;
  return ChatStream(turns, ctx, on_delta, err);
}

std::optional<HttpResponse> ModelAdapter::PostJson(const std::string& path,
                                                   const RequestHeaderList& headers,
                                                   const std::string& body,
                                                   const CallContext& ctx,
                                                   GatewayError* err) {
  HttpRequest req;
  req.path = path;
  req.headers = headers;
  req.body = body;
  auto res = transport_->Post(config_.http, req, ctx, err);
  if (!res) {
    if (err) err->message = Tag(path) + ": " + err->message;
    return std::nullopt;
  }
  if (!CheckStatus(path, *res, err)) return std::nullopt;
  return res;
}

std::optional<HttpResponse> ModelAdapter::PostJsonStream(const std::string& path,
                                                         const RequestHeaderList& headers,
                                                         const std::string& body,
                                                         const CallContext& ctx,
                                                         const BodyCallback& on_bytes,
                                                         GatewayError* err) {
  HttpRequest req;
  req.path = path;
  req.headers = headers;
  req.body = body;
  auto res = transport_->PostStream(config_.http, req, ctx, on_bytes, err);
  if (!res) {
    if (err) err->message = Tag(path) + ": " + err->message;
    return std::nullopt;
  }
  if (!CheckStatus(path, *res, err)) return std::nullopt;
  return res;
}

bool ModelAdapter::CheckStatus(const std::string& path, const HttpResponse& res, GatewayError* err) const {
  if (IsSuccessStatus(res.status)) return true;
  std::string msg = Tag(path) + " http " + std::to_string(res.status);
  if (!res.body.empty()) msg += ": " + ExtractUpstreamError(res.body);
  SetError(err, ErrorKind::kBackend, std::move(msg), res.status);
  return false;
}

bool ModelAdapter::CheckContext(const CallContext& ctx, GatewayError* err) const {
  if (ctx.cancel.IsCancelled()) {
    SetError(err, ErrorKind::kCancelled, config_.id + ": cancelled before start");
    return false;
  }
  if (ctx.Expired()) {
    SetError(err, ErrorKind::kTimeout, config_.id + ": deadline exceeded before start");
    return false;
  }
  return true;
}

}  // namespace gateway
