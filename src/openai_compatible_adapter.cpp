#include "openai_compatible_adapter.hpp"

#include "event_stream.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace gateway {
namespace {

constexpr const char* kChatPath = "/chat/completions";

}  // namespace

OpenAiCompatibleAdapter::OpenAiCompatibleAdapter(BackendConfig config, std::shared_ptr<IHttpTransport> transport)
    : ModelAdapter(std::move(config), std::move(transport)) {}

std::string OpenAiCompatibleAdapter::Vendor() const {
  return "openai";
}

std::string OpenAiCompatibleAdapter::BuildBody(const std::vector<ChatTurn>& turns, bool stream) const {
  nlohmann::json j;
  j["model"] = config_.model_name;
  j["stream"] = stream;
  if (config_.max_tokens.has_value()) j["max_tokens"] = config_.max_tokens.value();
  j["messages"] = nlohmann::json::array();
  for (const auto& t : turns) {
    j["messages"].push_back({{"role", t.role}, {"content", t.content}});
  }
  return j.dump();
}

RequestHeaderList OpenAiCompatibleAdapter::Headers() const {
  RequestHeaderList headers;
  if (!config_.api_key.empty()) headers.emplace_back("Authorization", "Bearer " + config_.api_key);
  return headers;
}

std::optional<std::string> OpenAiCompatibleAdapter::ChatOnce(const std::vector<ChatTurn>& turns,
                                                             const CallContext& ctx,
                                                             GatewayError* err) {
  auto res = PostJson(kChatPath, Headers(), BuildBody(turns, false), ctx, err);
  if (!res) return std::nullopt;

  auto jr = nlohmann::json::parse(res->body, nullptr, false);
  if (jr.is_discarded() || !jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() ||
      !jr["choices"][0].is_object() || !jr["choices"][0].contains("message") || !jr["choices"][0]["message"].is_object() ||
      !jr["choices"][0]["message"].contains("content") || !jr["choices"][0]["message"]["content"].is_string()) {
    SetError(err, ErrorKind::kMalformed, Tag(kChatPath) + ": invalid json from upstream");
    return std::nullopt;
  }
  return jr["choices"][0]["message"]["content"].get<std::string>();
}

bool OpenAiCompatibleAdapter::ChatStream(const std::vector<ChatTurn>& turns,
                                         const CallContext& ctx,
                                         const DeltaCallback& on_delta,
                                         GatewayError* err) {
  bool done = false;
  bool consumer_stopped = false;
  GatewayError stream_err;

  SseDecoder sse;
  auto on_event = [&](const SseEvent& ev) -> bool {
    if (done) return true;
    if (ev.data == "[DONE]") {
      done = true;
      return true;
    }
    auto j = nlohmann::json::parse(ev.data, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      stream_err = MakeError(ErrorKind::kMalformed, Tag(kChatPath) + ": invalid json in stream");
      return false;
    }
    if (j.contains("error")) {
      stream_err = MakeError(ErrorKind::kBackend, Tag(kChatPath) + ": " + ExtractUpstreamError(ev.data));
      return false;
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) return true;
    const auto& choice = j["choices"][0];
    if (!choice.is_object()) return true;
    if (choice.contains("delta") && choice["delta"].is_object() && choice["delta"].contains("content") &&
        choice["delta"]["content"].is_string()) {
      const auto text = choice["delta"]["content"].get<std::string>();
      if (!text.empty() && !on_delta(text)) {
        consumer_stopped = true;
        return false;
      }
    }
    return true;
  };

  auto res = PostJsonStream(
      kChatPath, Headers(), BuildBody(turns, true), ctx,
      [&](const char* data, size_t len) { return sse.Feed(data, len, on_event); }, err);

  if (!stream_err.ok()) {
    if (err) *err = std::move(stream_err);
    return false;
  }
  if (consumer_stopped) {
    SetError(err, ErrorKind::kCancelled, Tag(kChatPath) + ": stream stopped by consumer");
    return false;
  }
  if (!res) return false;

  if (!sse.Finish(on_event)) {
    if (!stream_err.ok()) {
      if (err) *err = std::move(stream_err);
    } else {
      SetError(err, ErrorKind::kCancelled, Tag(kChatPath) + ": stream stopped by consumer");
    }
    return false;
  }
  if (!done) {
    SetError(err, ErrorKind::kMalformed, Tag(kChatPath) + ": stream ended without [DONE]");
    return false;
  }
  return true;
}

}  // namespace gateway
