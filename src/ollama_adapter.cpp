#include "ollama_adapter.hpp"

#include "event_stream.hpp"

#include <string>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kChatPath = "/api/chat";

static std::optional<std::string> MessageContent(const nlohmann::json& j) {
  if (!j.contains("message") || !j["message"].is_object()) return std::nullopt;
  const auto& m = j["message"];
  if (!m.contains("content") || !m["content"].is_string()) return std::string();
  return m["content"].get<std::string>();
}

}  // namespace

OllamaAdapter::OllamaAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport)
    : ModelAdapter(std::move(config), std::move(transport)) {}

std::string OllamaAdapter::Vendor() const {
  return "ollama";
}

nlohmann::json OllamaAdapter::BuildBody(const std::vector<ChatTurn>& turns, bool stream) const {
  nlohmann::json j;
  j["model"] = config_.model_name;
  j["stream"] = stream;
  if (config_.max_tokens.has_value()) j["options"] = {{"num_predict", config_.max_tokens.value()}};
  j["messages"] = nlohmann::json::array();
  for (const auto& t : turns) {
    nlohmann::json jm;
    jm["role"] = t.role;
    jm["content"] = t.content;
    j["messages"].push_back(std::move(jm));
  }
  return j;
}

RequestHeaderList OllamaAdapter::Headers() const {
  RequestHeaderList headers;
  // Only hosted ollama needs a key; a local daemon ignores the header.
  if (!config_.api_key.empty()) headers.emplace_back("Authorization", "Bearer " + config_.api_key);
  return headers;
}

std::optional<std::string> OllamaAdapter::ChatOnce(const std::vector<ChatTurn>& turns,
                                                   const CallContext& ctx,
                                                   GatewayError* err) {
  auto res = PostJson(kChatPath, Headers(), BuildBody(turns, false).dump(), ctx, err);
  if (!res) return std::nullopt;

  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.is_object()) {
    SetError(err, ErrorKind::kMalformed, Tag(kChatPath) + ": invalid json from upstream");
    return std::nullopt;
  }
  if (jr.contains("error")) {
    SetError(err, ErrorKind::kBackend, Tag(kChatPath) + ": " + ExtractUpstreamError(res->body), res->status);
    return std::nullopt;
  }
  auto content = MessageContent(jr);
  if (!content) {
    SetError(err, ErrorKind::kMalformed, Tag(kChatPath) + ": response has no message");
    return std::nullopt;
  }
  return content;
}

bool OllamaAdapter::ChatStream(const std::vector<ChatTurn>& turns,
                               const CallContext& ctx,
                               const DeltaCallback& on_delta,
                               GatewayError* err) {
  bool done = false;
  bool consumer_stopped = false;
  GatewayError stream_err;

  LineDecoder lines;
  auto on_line = [&](const std::string& line) -> bool {
    if (done || line.empty()) return true;
    auto j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      stream_err = MakeError(ErrorKind::kMalformed, Tag(kChatPath) + ": invalid json line in stream");
      return false;
    }
    if (j.contains("error")) {
      stream_err = MakeError(ErrorKind::kBackend, Tag(kChatPath) + ": " + ExtractUpstreamError(line));
      return false;
    }
    if (auto content = MessageContent(j); content && !content->empty()) {
      if (!on_delta(*content)) {
        consumer_stopped = true;
        return false;
      }
    }
    if (j.contains("done") && j["done"].is_boolean() && j["done"].get<bool>()) done = true;
    return true;
  };

  auto res = PostJsonStream(
      kChatPath, Headers(), BuildBody(turns, true).dump(), ctx,
      [&](const char* data, size_t len) { return lines.Feed(data, len, on_line); }, err);

  if (!stream_err.ok()) {
    if (err) *err = std::move(stream_err);
    return false;
  }
  if (consumer_stopped) {
    SetError(err, ErrorKind::kCancelled, Tag(kChatPath) + ": stream stopped by consumer");
    return false;
  }
  if (!res) return false;

  if (!lines.Finish(on_line)) {
    if (!stream_err.ok()) {
      if (err) *err = std::move(stream_err);
    } else {
      SetError(err, ErrorKind::kCancelled, Tag(kChatPath) + ": stream stopped by consumer");
    }
    return false;
  }
  if (!done) {
    SetError(err, ErrorKind::kMalformed, Tag(kChatPath) + ": stream ended before done");
    return false;
  }
  return true;
}

}  // namespace gateway
