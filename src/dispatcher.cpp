#include "dispatcher.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace gateway {
namespace {

static std::string FormatSeconds(double s) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(3) << s;
  return ss.str();
}

static void LogRejected(const char* op, const std::string& model, const GatewayError& err) {
  std::cout << "[dispatch] op=" << op << " model=" << model << " rejected=" << ErrorKindName(err.kind)
            << " message=" << err.message << "\n";
}

// Wraps a buffered call so it reports through the same delta channel as a
// streamed one: one delta with the whole text.
static bool ForwardWhole(std::optional<std::string> text, const DeltaCallback& on_delta, GatewayError* err) {
  if (!text) return false;
  if (!text->empty() && !on_delta(*text)) {
    SetError(err, ErrorKind::kCancelled, "result discarded after origin ended");
    return false;
  }
  return true;
}

static OriginTask GenerateTask(ModelAdapter* adapter, Clock::time_point deadline, std::string prompt, bool stream) {
  OriginTask t;
  t.origin = adapter->Id();
  t.deadline = deadline;
  if (stream) {
    t.run = [adapter, prompt = std::move(prompt)](const CallContext& ctx, const DeltaCallback& on_delta,
                                                  GatewayError* err) {
      return adapter->GenerateStream(prompt, ctx, on_delta, err);
    };
  } else {
    t.run = [adapter, prompt = std::move(prompt)](const CallContext& ctx, const DeltaCallback& on_delta,
                                                  GatewayError* err) {
      return ForwardWhole(adapter->Generate(prompt, ctx, err), on_delta, err);
    };
  }
  return t;
}

static OriginTask ConverseTask(ModelAdapter* adapter,
                               Clock::time_point deadline,
                               std::vector<ChatTurn> turns,
                               bool stream) {
  OriginTask t;
  t.origin = adapter->Id();
  t.deadline = deadline;
  if (stream) {
    t.run = [adapter, turns = std::move(turns)](const CallContext& ctx, const DeltaCallback& on_delta,
                                                GatewayError* err) {
      return adapter->ConverseStream(turns, ctx, on_delta, err);
    };
  } else {
    t.run = [adapter, turns = std::move(turns)](const CallContext& ctx, const DeltaCallback& on_delta,
                                                GatewayError* err) {
      return ForwardWhole(adapter->Converse(turns, ctx, err), on_delta, err);
    };
  }
  return t;
}

}  // namespace

const OriginResult* AggregatedResponse::Find(const std::string& model) const {
  for (const auto& r : results) {
    if (r.model == model) return &r;
  }
  return nullptr;
}

size_t AggregatedResponse::SuccessCount() const {
  size_t n = 0;
  for (const auto& r : results) {
    if (r.ok) n++;
  }
  return n;
}

Dispatcher::Dispatcher(const ModelRegistry* registry, std::chrono::milliseconds default_timeout)
    : registry_(registry), default_timeout_(default_timeout), stats_(std::make_shared<StatsState>()) {}

Clock::time_point Dispatcher::DeadlineFor(const ModelAdapter& adapter, const DispatchOptions& opts) const {
  std::chrono::milliseconds timeout = default_timeout_;
  if (opts.timeout) {
    timeout = *opts.timeout;
  } else if (adapter.Config().timeout_ms) {
    timeout = std::chrono::milliseconds(*adapter.Config().timeout_ms);
  }
  return Clock::now() + timeout;
}

std::unique_ptr<ChunkStream> Dispatcher::Launch(const char* op,
                                                std::vector<OriginTask> tasks,
                                                const DispatchOptions& opts) {
  const auto start = Clock::now();
  std::cout << "[dispatch] op=" << op << " origins=" << tasks.size() << "\n";

  auto agg = std::make_unique<StreamAggregator>(std::move(tasks), opts.cancel);
  std::shared_ptr<StatsState> stats = stats_;
  std::string name = op;
  agg->SetOnFinished([stats, start, name]() {
    const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    {
      std::lock_guard<std::mutex> lock(stats->mu);
      auto& s = stats->stats;
      if (s.total_requests == 0 || elapsed < s.min_seconds) s.min_seconds = elapsed;
      if (elapsed > s.max_seconds) s.max_seconds = elapsed;
      s.total_requests++;
      s.total_seconds += elapsed;
    }
    std::cout << "[perf] " << name << " request took " << FormatSeconds(elapsed) << " seconds\n";
  });
  agg->Start();
  return agg;
}

AggregatedResponse Dispatcher::Collect(ChunkStream* stream, const std::vector<std::string>& order) {
  std::unordered_map<std::string, OriginResult> by_origin;
  while (auto c = stream->Next()) {
    if (!c->terminal) continue;
    OriginResult r;
    r.model = c->origin;
    r.ok = c->kind == ChunkKind::kFinal;
    if (r.ok) {
      r.text = std::move(c->text);
    } else {
      r.error = std::move(c->error);
    }
    by_origin[r.model] = std::move(r);
  }

  AggregatedResponse out;
  out.results.reserve(order.size());
  for (const auto& id : order) {
    auto it = by_origin.find(id);
    if (it != by_origin.end()) {
      out.results.push_back(std::move(it->second));
      continue;
    }
    OriginResult missing;
    missing.model = id;
    missing.error = MakeError(ErrorKind::kBackend, id + ": no result");
    out.results.push_back(std::move(missing));
  }
  return out;
}

std::optional<std::string> Dispatcher::DispatchSingle(const std::string& model,
                                                      const GenerationRequest& req,
                                                      const DispatchOptions& opts,
                                                      GatewayError* err) {
  auto* adapter = registry_->Resolve(model, err);
  if (!adapter) {
    if (err) LogRejected("generate", model, *err);
    return std::nullopt;
  }

  std::vector<OriginTask> tasks;
  tasks.push_back(GenerateTask(adapter, DeadlineFor(*adapter, opts), req.prompt, false));
  auto stream = Launch("generate", std::move(tasks), opts);
  auto agg = Collect(stream.get(), {model});
  stream.reset();

  auto& r = agg.results.front();
  if (!r.ok) {
    if (err) *err = std::move(r.error);
    return std::nullopt;
  }
  return std::move(r.text);
}

AggregatedResponse Dispatcher::DispatchAll(const GenerationRequest& req, const DispatchOptions& opts) {
  std::vector<OriginTask> tasks;
  for (const auto& id : registry_->List()) {
    auto* adapter = registry_->Resolve(id, nullptr);
    tasks.push_back(GenerateTask(adapter, DeadlineFor(*adapter, opts), req.prompt, false));
  }
  auto stream = Launch("generate_all", std::move(tasks), opts);
  auto out = Collect(stream.get(), registry_->List());
  stream.reset();
  return out;
}

std::optional<ConversationResult> Dispatcher::Converse(const ConversationRequest& req,
                                                       const DispatchOptions& opts,
                                                       GatewayError* err) {
  auto* adapter = registry_->Resolve(req.model, err);
  if (!adapter || !ValidateTurns(req.turns, err)) {
    if (err) LogRejected("conversation", req.model, *err);
    return std::nullopt;
  }

  auto turns = req.show_reasoning ? WithReasoningPrompt(req.turns) : req.turns;
  std::vector<OriginTask> tasks;
  tasks.push_back(ConverseTask(adapter, DeadlineFor(*adapter, opts), std::move(turns), false));
  auto stream = Launch("conversation", std::move(tasks), opts);
  auto agg = Collect(stream.get(), {req.model});
  stream.reset();

  auto& r = agg.results.front();
  if (!r.ok) {
    if (err) *err = std::move(r.error);
    return std::nullopt;
  }
  ConversationResult out;
  if (req.show_reasoning) {
    auto split = SplitReasoning(r.text);
    out.response = std::move(split.response);
    out.reasoning = std::move(split.reasoning);
  } else {
    out.response = std::move(r.text);
  }
  return out;
}

std::unique_ptr<ChunkStream> Dispatcher::DispatchSingleStream(const std::string& model,
                                                              const GenerationRequest& req,
                                                              const DispatchOptions& opts,
                                                              GatewayError* err) {
  auto* adapter = registry_->Resolve(model, err);
  if (!adapter) {
    if (err) LogRejected("generate_stream", model, *err);
    return nullptr;
  }
  std::vector<OriginTask> tasks;
  tasks.push_back(GenerateTask(adapter, DeadlineFor(*adapter, opts), req.prompt, true));
  return Launch("generate_stream", std::move(tasks), opts);
}

std::unique_ptr<ChunkStream> Dispatcher::DispatchAllStream(const GenerationRequest& req, const DispatchOptions& opts) {
  std::vector<OriginTask> tasks;
  for (const auto& id : registry_->List()) {
    auto* adapter = registry_->Resolve(id, nullptr);
    tasks.push_back(GenerateTask(adapter, DeadlineFor(*adapter, opts), req.prompt, true));
  }
  return Launch("generate_all_stream", std::move(tasks), opts);
}

std::unique_ptr<ChunkStream> Dispatcher::ConverseStream(const ConversationRequest& req,
                                                        const DispatchOptions& opts,
                                                        GatewayError* err) {
  auto* adapter = registry_->Resolve(req.model, err);
  if (!adapter || !ValidateTurns(req.turns, err)) {
    if (err) LogRejected("conversation_stream", req.model, *err);
    return nullptr;
  }
  auto turns = req.show_reasoning ? WithReasoningPrompt(req.turns) : req.turns;
  std::vector<OriginTask> tasks;
  tasks.push_back(ConverseTask(adapter, DeadlineFor(*adapter, opts), std::move(turns), true));
  return Launch("conversation_stream", std::move(tasks), opts);
}

RequestStats Dispatcher::Stats() const {
  std::lock_guard<std::mutex> lock(stats_->mu);
  return stats_->stats;
}

}  // namespace gateway
