#pragma once

#include "adapters/registry.hpp"
#include "call_context.hpp"
#include "chunk_stream.hpp"
#include "reasoning.hpp"
#include "stream_aggregator.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gateway {

struct GenerationRequest {
  std::string prompt;
  bool stream = false;
};

struct ConversationRequest {
  std::string model;
  std::vector<ChatTurn> turns;
  bool stream = false;
  bool show_reasoning = false;
};

struct DispatchOptions {
  // Overrides the backend's configured timeout and the dispatcher default.
  std::optional<std::chrono::milliseconds> timeout;
  // Cancelling it cancels every call started with these options.
  CancelToken cancel;
};

struct OriginResult {
  std::string model;
  bool ok = false;
  std::string text;
  GatewayError error;
};

struct AggregatedResponse {
  // One entry per targeted model, registry order.
  std::vector<OriginResult> results;

  const OriginResult* Find(const std::string& model) const;
  size_t SuccessCount() const;
};

struct ConversationResult {
  std::string response;
  // Empty unless the request asked for reasoning.
  std::string reasoning;
};

struct RequestStats {
  uint64_t total_requests = 0;
  double total_seconds = 0;
  double min_seconds = 0;
  double max_seconds = 0;
};

class Dispatcher {
 public:
  static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

  explicit Dispatcher(const ModelRegistry* registry, std::chrono::milliseconds default_timeout = kDefaultTimeout);

  const ModelRegistry* Registry() const { return registry_; }

  std::optional<std::string> DispatchSingle(const std::string& model,
                                            const GenerationRequest& req,
                                            const DispatchOptions& opts,
                                            GatewayError* err);

  // Never fails as a whole; each registered model gets its own entry.
  AggregatedResponse DispatchAll(const GenerationRequest& req, const DispatchOptions& opts);

  std::optional<ConversationResult> Converse(const ConversationRequest& req,
                                             const DispatchOptions& opts,
                                             GatewayError* err);

  // Streaming variants. The single-model ones return nullptr and fill *err
  // when the request is rejected before any backend is contacted.
  std::unique_ptr<ChunkStream> DispatchSingleStream(const std::string& model,
                                                    const GenerationRequest& req,
                                                    const DispatchOptions& opts,
                                                    GatewayError* err);
  std::unique_ptr<ChunkStream> DispatchAllStream(const GenerationRequest& req, const DispatchOptions& opts);
  std::unique_ptr<ChunkStream> ConverseStream(const ConversationRequest& req,
                                              const DispatchOptions& opts,
                                              GatewayError* err);

  RequestStats Stats() const;

 private:
  struct StatsState {
    std::mutex mu;
    RequestStats stats;
  };

  Clock::time_point DeadlineFor(const ModelAdapter& adapter, const DispatchOptions& opts) const;
  std::unique_ptr<ChunkStream> Launch(const char* op, std::vector<OriginTask> tasks, const DispatchOptions& opts);
  // Drains a launched stream into per-origin results, in `order`.
  AggregatedResponse Collect(ChunkStream* stream, const std::vector<std::string>& order);

  const ModelRegistry* registry_;
  std::chrono::milliseconds default_timeout_;
  std::shared_ptr<StatsState> stats_;
};

}  // namespace gateway
