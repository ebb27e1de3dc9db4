#include "anthropic_adapter.hpp"

#include "event_stream.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kMessagesPath = "/messages";
constexpr const char* kApiVersion = "2023-06-01";
constexpr int kDefaultMaxTokens = 1000;

}  // namespace

AnthropicAdapter::AnthropicAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport)
    : ModelAdapter(std::move(config), std::move(transport)) {}

std::string AnthropicAdapter::Vendor() const {
  return "anthropic";
}

std::string AnthropicAdapter::BuildBody(const std::vector<ChatTurn>& turns, bool stream) const {
  nlohmann::json j;
  j["model"] = config_.model_name;
  j["max_tokens"] = config_.max_tokens.value_or(kDefaultMaxTokens);
  j["stream"] = stream;
  std::string system;
  j["messages"] = nlohmann::json::array();
  for (const auto& t : turns) {
    if (t.role == "system") {
      if (!system.empty()) system += "\n\n";
      system += t.content;
      continue;
    }
    j["messages"].push_back({{"role", t.role}, {"content", t.content}});
  }
  if (!system.empty()) j["system"] = system;
  return j.dump();
}

RequestHeaderList AnthropicAdapter::Headers() const {
  RequestHeaderList headers;
  headers.emplace_back("anthropic-version", kApiVersion);
  if (!config_.api_key.empty()) headers.emplace_back("x-api-key", config_.api_key);
  return headers;
}

std::optional<std::string> AnthropicAdapter::ChatOnce(const std::vector<ChatTurn>& turns,
                                                      const CallContext& ctx,
                                                      GatewayError* err) {
  auto res = PostJson(kMessagesPath, Headers(), BuildBody(turns, false), ctx, err);
  if (!res) return std::nullopt;

  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.is_object() || !jr.contains("content") || !jr["content"].is_array()) {
    SetError(err, ErrorKind::kMalformed, Tag(kMessagesPath) + ": invalid json from upstream");
    return std::nullopt;
  }
  std::string text;
  bool saw_text = false;
  for (const auto& block : jr["content"]) {
    if (!block.is_object() || !block.contains("type") || block["type"] != "text") continue;
    if (!block.contains("text") || !block["text"].is_string()) continue;
    text += block["text"].get<std::string>();
    saw_text = true;
  }
  if (!saw_text) {
    SetError(err, ErrorKind::kMalformed, Tag(kMessagesPath) + ": response has no text content");
    return std::nullopt;
  }
  return text;
}

bool AnthropicAdapter::ChatStream(const std::vector<ChatTurn>& turns,
                                  const CallContext& ctx,
                                  const DeltaCallback& on_delta,
                                  GatewayError* err) {
  bool done = false;
  bool consumer_stopped = false;
  GatewayError stream_err;

  SseDecoder sse;
  auto on_event = [&](const SseEvent& ev) -> bool {
    if (done) return true;
    auto j = nlohmann::json::parse(ev.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      stream_err = MakeError(ErrorKind::kMalformed, Tag(kMessagesPath) + ": invalid json in stream");
      return false;
    }
    std::string type = ev.event;
    if (j.contains("type") && j["type"].is_string()) type = j["type"].get<std::string>();

    if (type == "error") {
      stream_err = MakeError(ErrorKind::kBackend, Tag(kMessagesPath) + ": " + ExtractUpstreamError(ev.data));
      return false;
    }
    if (type == "message_stop") {
      done = true;
      return true;
    }
    if (type != "content_block_delta") return true;
    if (!j.contains("delta") || !j["delta"].is_object()) return true;
    const auto& delta = j["delta"];
    if (!delta.contains("text") || !delta["text"].is_string()) return true;
    const auto text = delta["text"].get<std::string>();
    if (!text.empty() && !on_delta(text)) {
      consumer_stopped = true;
      return false;
    }
    return true;
  };

  auto res = PostJsonStream(
      kMessagesPath, Headers(), BuildBody(turns, true), ctx,
      [&](const char* data, size_t len) { return sse.Feed(data, len, on_event); }, err);

  if (!stream_err.ok()) {
    if (err) *err = std::move(stream_err);
    return false;
  }
  if (consumer_stopped) {
    SetError(err, ErrorKind::kCancelled, Tag(kMessagesPath) + ": stream stopped by consumer");
    return false;
  }
  if (!res) return false;

  if (!sse.Finish(on_event)) {
    if (!stream_err.ok()) {
      if (err) *err = std::move(stream_err);
    } else {
      SetError(err, ErrorKind::kCancelled, Tag(kMessagesPath) + ": stream stopped by consumer");
    }
    return false;
  }
  if (!done) {
    SetError(err, ErrorKind::kMalformed, Tag(kMessagesPath) + ": stream ended without message_stop");
    return false;
  }
  return true;
}

}  // namespace gateway
