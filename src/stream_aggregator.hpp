#pragma once

#include "adapters/adapter.hpp"
#include "call_context.hpp"
#include "chunk_stream.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace gateway {

enum class OriginState {
  kPending,
  kStreaming,
  kCompleted,
  kFailed,
};

const char* OriginStateName(OriginState state);

// Runs one backend call, reporting text through on_delta. Returns false and
// fills *err on failure.
using OriginRunner = std::function<bool(const CallContext& ctx, const DeltaCallback& on_delta, GatewayError* err)>;

struct OriginTask {
  std::string origin;
  Clock::time_point deadline = Clock::time_point::max();
  OriginRunner run;
};

// Fans N origin tasks out on their own threads and merges their output into
// one chunk sequence. Order is kept within an origin, not across origins.
// Each origin ends with exactly one terminal chunk; a failure, timeout or
// cancellation of one origin never touches the others. Cancelling the caller
// token fails every origin that is still open with kCancelled, whether or not
// its task is watching its token.
class StreamAggregator : public ChunkStream {
 public:
  StreamAggregator(std::vector<OriginTask> tasks, CancelToken caller);
  ~StreamAggregator() override;

  StreamAggregator(const StreamAggregator&) = delete;
  StreamAggregator& operator=(const StreamAggregator&) = delete;

  void Start();

  std::optional<ResultChunk> Next() override;
  std::optional<ResultChunk> NextFor(std::chrono::milliseconds timeout, bool* finished) override;

  // Fails every origin that is not terminal yet with kCancelled, cancels
  // their calls and waits for all tasks to return.
  void Cancel() override;

  // Blocks until every origin task has returned.
  void Wait();

  // Runs once when the aggregator is destroyed.
  void SetOnFinished(std::function<void()> fn) { on_finished_ = std::move(fn); }

  OriginState State(const std::string& origin) const;
  size_t RunningTasks() const;

 private:
  struct Origin {
    std::string id;
    OriginState state = OriginState::kPending;
    size_t next_index = 0;
    std::string text;
    CancelToken cancel;
    Clock::time_point deadline;
    bool task_returned = false;
  };

  bool PushDelta(size_t slot, const std::string& delta);
  // Caller holds mu_. Returns false when the origin was already terminal.
  bool FinishLocked(size_t slot, bool ok, GatewayError error);
  bool IsTerminal(OriginState s) const { return s == OriginState::kCompleted || s == OriginState::kFailed; }
  bool AllTerminalLocked() const { return terminal_count_ == origins_.size(); }
  void RunOrigin(size_t slot);
  void WatchDeadlines();
  void StopWatcher();
  // Fails every non-terminal origin with kCancelled and cancels the calls
  // still running, without waiting for them.
  void FailRemaining();

  std::vector<OriginTask> tasks_;
  CancelToken caller_;
  int caller_callback_ = -1;

  mutable std::mutex mu_;
  std::condition_variable chunk_cv_;
  std::condition_variable watch_cv_;
  std::deque<ResultChunk> queue_;
  std::vector<Origin> origins_;
  size_t terminal_count_ = 0;
  size_t running_ = 0;
  bool stopping_ = false;
  bool started_ = false;

  std::mutex join_mu_;
  std::vector<std::thread> threads_;
  std::thread watcher_;
  std::function<void()> on_finished_;
};

}  // namespace gateway
