#include "gateway_router.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <utility>

namespace gateway {
namespace {

constexpr std::chrono::milliseconds kStreamPoll{250};

static nlohmann::json MakeErrorBody(const GatewayError& err) {
  nlohmann::json j;
  j["error"] = ErrorToJson(err);
  return j;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_header("Content-Type", "application/json");
  res->set_content(body.dump(), "application/json");
}

static void SendError(httplib::Response* res, const GatewayError& err) {
  SendJson(res, HttpStatusForError(err.kind), MakeErrorBody(err));
}

static void SendBadRequest(httplib::Response* res, const std::string& message) {
  SendError(res, MakeError(ErrorKind::kBadRequest, message));
}

static std::string SseData(const nlohmann::json& j) {
  return std::string("data: ") + j.dump() + "\n\n";
}

static std::string SseDone() {
  return "data: [DONE]\n\n";
}

static nlohmann::json ParseJsonBody(const httplib::Request& req) {
  if (req.body.empty()) return nlohmann::json::object();
  return nlohmann::json::parse(req.body, nullptr, false);
}

static bool BoolField(const nlohmann::json& body, const char* key) {
  return body.contains(key) && body[key].is_boolean() && body[key].get<bool>();
}

static DispatchOptions OptionsFromBody(const nlohmann::json& body) {
  DispatchOptions opts;
  if (body.contains("timeout_ms") && body["timeout_ms"].is_number_integer()) {
    const auto ms = body["timeout_ms"].get<long long>();
    if (ms > 0) opts.timeout = std::chrono::milliseconds(ms);
  }
  return opts;
}

static std::optional<std::string> PromptFrom(const httplib::Request& req, const nlohmann::json& body) {
  if (body.contains("prompt") && body["prompt"].is_string()) return body["prompt"].get<std::string>();
  if (req.has_param("prompt")) return req.get_param_value("prompt");
  return std::nullopt;
}

static void LogRequest(const httplib::Request& req) {
  std::cout << "[http] " << req.method << " " << req.path << " body_bytes=" << req.body.size() << "\n";
}

using WriteFn = std::function<bool(const std::string&)>;
// Writes whatever the chunk turns into. Returning false aborts the response.
using ChunkWriter = std::function<bool(const ResultChunk&, const WriteFn&)>;

// Pumps a chunk stream into an SSE response. The stream is cancelled when the
// client goes away before it is exhausted.
static void ServeStream(httplib::Response* res, std::shared_ptr<ChunkStream> stream, ChunkWriter on_chunk) {
  res->status = 200;
  res->set_header("Cache-Control", "no-cache");
  res->set_chunked_content_provider(
      "text/event-stream",
      [stream, on_chunk](size_t, httplib::DataSink& sink) {
        auto write_bytes = [&](const std::string& s) -> bool {
          if (sink.is_writable && !sink.is_writable()) return false;
          if (!sink.write) return false;
          return sink.write(s.data(), s.size());
        };

        try {
          for (;;) {
            bool finished = false;
            auto c = stream->NextFor(kStreamPoll, &finished);
            if (!c) {
              if (finished) break;
              if (!write_bytes(": keepalive\n\n")) {
                stream->Cancel();
                return false;
              }
              continue;
            }
            if (!on_chunk(*c, write_bytes)) {
              stream->Cancel();
              return false;
            }
          }
          if (!write_bytes(SseDone())) return false;
        } catch (const std::exception& e) {
          std::cout << "[http] stream aborted: " << e.what() << "\n";
          stream->Cancel();
          return false;
        }
        sink.done();
        return true;
      },
      [stream](bool success) {
        if (!success) stream->Cancel();
      });
}

static ChunkWriter TaggedChunkWriter() {
  return [](const ResultChunk& c, const WriteFn& write) { return write(SseData(ChunkToJson(c))); };
}

// Emits {"reasoning", "response"} snapshots for a single conversation. A
// successful stream always carries at least one snapshot.
static ChunkWriter ConversationChunkWriter(bool show_reasoning) {
  auto splitter = std::make_shared<ReasoningStreamSplitter>(show_reasoning);
  auto acc = std::make_shared<std::string>();
  auto wrote = std::make_shared<bool>(false);
  return [show_reasoning, splitter, acc, wrote](const ResultChunk& c, const WriteFn& write) {
    auto send = [&](const ReasoningSplit& s) {
      *wrote = true;
      return write(SseData(nlohmann::json{{"reasoning", s.reasoning}, {"response", s.response}}));
    };
    switch (c.kind) {
      case ChunkKind::kPartial:
        if (!show_reasoning) {
          *acc += c.text;
          return send(ReasoningSplit{"", *acc});
        }
        if (auto s = splitter->Feed(c.text)) return send(*s);
        return true;
      case ChunkKind::kFinal:
        if (show_reasoning) return send(splitter->Finish());
        if (!*wrote) return send(ReasoningSplit{"", *acc});
        return true;
      case ChunkKind::kError:
        return write(SseData(nlohmann::json{{"error", c.error.message}}));
    }
    return true;
  };
}

}  // namespace

nlohmann::json ErrorToJson(const GatewayError& err) {
  nlohmann::json j;
  j["kind"] = ErrorKindName(err.kind);
  j["message"] = err.message;
  if (err.status != 0) j["status"] = err.status;
  return j;
}

nlohmann::json ChunkToJson(const ResultChunk& chunk) {
  nlohmann::json j;
  j["model"] = chunk.origin;
  j["index"] = chunk.index;
  j["type"] = ChunkKindName(chunk.kind);
  if (chunk.kind == ChunkKind::kError) {
    j["error"] = ErrorToJson(chunk.error);
  } else {
    j["text"] = chunk.text;
  }
  j["terminal"] = chunk.terminal;
  return j;
}

std::optional<std::vector<ChatTurn>> ParseTurns(const nlohmann::json& messages, std::string* err) {
  if (!messages.is_array()) {
    if (err) *err = "messages must be an array";
    return std::nullopt;
  }
  std::vector<ChatTurn> turns;
  turns.reserve(messages.size());
  for (const auto& m : messages) {
    if (!m.is_object() || !m.contains("role") || !m["role"].is_string()) {
      if (err) *err = "each message needs a string role";
      return std::nullopt;
    }
    ChatTurn t;
    t.role = m["role"].get<std::string>();
    if (m.contains("content")) {
      const auto& content = m["content"];
      if (content.is_string()) {
        t.content = content.get<std::string>();
      } else if (content.is_array()) {
        for (const auto& part : content) {
          if (part.is_string()) {
            t.content += part.get<std::string>();
          } else if (part.is_object() && part.contains("text") && part["text"].is_string()) {
            t.content += part["text"].get<std::string>();
          }
        }
      } else if (!content.is_null()) {
        if (err) *err = "message content must be a string";
        return std::nullopt;
      }
    }
    turns.push_back(std::move(t));
  }
  return turns;
}

GatewayRouter::GatewayRouter(Dispatcher* dispatcher) : dispatcher_(dispatcher) {}

void GatewayRouter::Register(httplib::Server* server) {
  server->Get("/models", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    nlohmann::json out;
    out["models"] = dispatcher_->Registry()->List();
    SendJson(&res, 200, out);
  });

  server->Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const auto s = dispatcher_->Stats();
    nlohmann::json out;
    out["total_requests"] = s.total_requests;
    out["total_time"] = s.total_seconds;
    out["avg_time"] = s.total_requests ? s.total_seconds / static_cast<double>(s.total_requests) : 0.0;
    out["min_time"] = s.min_seconds;
    out["max_time"] = s.max_seconds;
    SendJson(&res, 200, out);
  });

  server->Post(R"(/generate/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    const std::string model = req.matches[1];
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) return SendBadRequest(&res, "invalid json body");
    auto prompt = PromptFrom(req, body);
    if (!prompt) return SendBadRequest(&res, "missing required field: prompt");

    GenerationRequest g;
    g.prompt = std::move(*prompt);
    g.stream = BoolField(body, "stream");
    auto opts = OptionsFromBody(body);

    GatewayError err;
    if (g.stream) {
      std::shared_ptr<ChunkStream> stream = dispatcher_->DispatchSingleStream(model, g, opts, &err);
      if (!stream) return SendError(&res, err);
      return ServeStream(&res, std::move(stream), TaggedChunkWriter());
    }
    auto text = dispatcher_->DispatchSingle(model, g, opts, &err);
    if (!text) return SendError(&res, err);
    SendJson(&res, 200, nlohmann::json{{"model", model}, {"response", *text}});
  });

  server->Post("/generate_all", [this](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) return SendBadRequest(&res, "invalid json body");
    auto prompt = PromptFrom(req, body);
    if (!prompt) return SendBadRequest(&res, "missing required field: prompt");

    GenerationRequest g;
    g.prompt = std::move(*prompt);
    g.stream = BoolField(body, "stream");
    auto opts = OptionsFromBody(body);

    if (g.stream) {
      std::shared_ptr<ChunkStream> stream = dispatcher_->DispatchAllStream(g, opts);
      return ServeStream(&res, std::move(stream), TaggedChunkWriter());
    }
    const auto agg = dispatcher_->DispatchAll(g, opts);
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& r : agg.results) {
      if (r.ok) {
        out[r.model] = {{"response", r.text}};
      } else {
        out[r.model] = {{"error", ErrorToJson(r.error)}};
      }
    }
    res.status = 200;
    res.set_content(out.dump(), "application/json");
  });

  // Body problems are kBadRequest, malformed messages are kInvalidTurns.
  auto parse_conversation = [](const httplib::Request& req, ConversationRequest* out, DispatchOptions* opts,
                               GatewayError* err) -> bool {
    auto body = ParseJsonBody(req);
    if (body.is_discarded() || !body.is_object()) {
      SetError(err, ErrorKind::kBadRequest, "invalid json body");
      return false;
    }
    if (!body.contains("model_name") || !body["model_name"].is_string()) {
      SetError(err, ErrorKind::kBadRequest, "missing required field: model_name");
      return false;
    }
    std::string turns_err;
    auto turns = ParseTurns(body.contains("messages") ? body["messages"] : nlohmann::json::array(), &turns_err);
    if (!turns) {
      SetError(err, ErrorKind::kInvalidTurns, turns_err);
      return false;
    }
    out->model = body["model_name"].get<std::string>();
    out->turns = std::move(*turns);
    out->show_reasoning = BoolField(body, "show_reasoning");
    out->stream = BoolField(body, "stream");
    *opts = OptionsFromBody(body);
    return true;
  };

  server->Post("/conversation", [this, parse_conversation](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    ConversationRequest c;
    DispatchOptions opts;
    GatewayError err;
    if (!parse_conversation(req, &c, &opts, &err)) return SendError(&res, err);

    auto result = dispatcher_->Converse(c, opts, &err);
    if (!result) return SendError(&res, err);
    nlohmann::json out;
    out["response"] = result->response;
    if (c.show_reasoning) out["reasoning"] = result->reasoning;
    SendJson(&res, 200, out);
  });

  server->Post("/conversation_stream", [this, parse_conversation](const httplib::Request& req, httplib::Response& res) {
    LogRequest(req);
    ConversationRequest c;
    DispatchOptions opts;
    GatewayError err;
    if (!parse_conversation(req, &c, &opts, &err)) return SendError(&res, err);
    c.stream = true;

    std::shared_ptr<ChunkStream> stream = dispatcher_->ConverseStream(c, opts, &err);
    if (!stream) return SendError(&res, err);
    ServeStream(&res, std::move(stream), ConversationChunkWriter(c.show_reasoning));
  });
}

}  // namespace gateway
