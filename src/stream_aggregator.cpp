#include "stream_aggregator.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace gateway {

const char* OriginStateName(OriginState state) {
  switch (state) {
    case OriginState::kPending:
      return "pending";
    case OriginState::kStreaming:
      return "streaming";
    case OriginState::kCompleted:
      return "completed";
    case OriginState::kFailed:
      return "failed";
  }
  return "unknown";
}

StreamAggregator::StreamAggregator(std::vector<OriginTask> tasks, CancelToken caller)
    : tasks_(std::move(tasks)), caller_(std::move(caller)) {
  origins_.reserve(tasks_.size());
  for (const auto& t : tasks_) {
    Origin o;
    o.id = t.origin;
    o.cancel = caller_.Child();
    o.deadline = t.deadline;
    origins_.push_back(std::move(o));
  }
}

StreamAggregator::~StreamAggregator() {
  caller_.RemoveCallback(caller_callback_);
  Cancel();
  StopWatcher();
  if (on_finished_) on_finished_();
}

void StreamAggregator::Start() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (started_) return;
    started_ = true;
    running_ = origins_.size();
  }
  std::lock_guard<std::mutex> join_lock(join_mu_);
  threads_.reserve(origins_.size());
  for (size_t i = 0; i < origins_.size(); i++) {
    threads_.emplace_back([this, i]() { RunOrigin(i); });
  }
  watcher_ = std::thread([this]() { WatchDeadlines(); });
  caller_callback_ = caller_.OnCancel([this]() { FailRemaining(); });
}

bool StreamAggregator::PushDelta(size_t slot, const std::string& delta) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& o = origins_[slot];
  if (IsTerminal(o.state)) return false;
  if (o.state == OriginState::kPending) o.state = OriginState::kStreaming;
  ResultChunk c;
  c.origin = o.id;
  c.index = o.next_index++;
  c.kind = ChunkKind::kPartial;
  c.text = delta;
  o.text += delta;
  queue_.push_back(std::move(c));
  chunk_cv_.notify_all();
  return true;
}

bool StreamAggregator::FinishLocked(size_t slot, bool ok, GatewayError error) {
  auto& o = origins_[slot];
  if (IsTerminal(o.state)) return false;
  o.state = ok ? OriginState::kCompleted : OriginState::kFailed;

  ResultChunk c;
  c.origin = o.id;
  c.index = o.next_index++;
  c.terminal = true;
  if (ok) {
    c.kind = ChunkKind::kFinal;
    c.text = o.text;
  } else {
    c.kind = ChunkKind::kError;
    c.error = std::move(error);
  }
  std::cout << "[stream] origin=" << o.id << " state=" << OriginStateName(o.state) << " chunks=" << o.next_index;
  if (!ok) std::cout << " error=" << ErrorKindName(c.error.kind) << " message=" << c.error.message;
  std::cout << "\n";

  queue_.push_back(std::move(c));
  terminal_count_++;
  chunk_cv_.notify_all();
  watch_cv_.notify_all();
  return true;
}

void StreamAggregator::RunOrigin(size_t slot) {
  CallContext ctx;
  {
    std::lock_guard<std::mutex> lock(mu_);
    ctx.cancel = origins_[slot].cancel;
    ctx.deadline = origins_[slot].deadline;
  }

  GatewayError err;
  bool ok = false;
  try {
    ok = tasks_[slot].run(ctx, [this, slot](const std::string& delta) { return PushDelta(slot, delta); }, &err);
  } catch (const std::exception& e) {
    ok = false;
    err = MakeError(ErrorKind::kBackend, origins_[slot].id + ": " + e.what());
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (ok) {
    FinishLocked(slot, true, GatewayError{});
  } else {
    if (err.ok()) err = MakeError(ErrorKind::kBackend, origins_[slot].id + ": call failed");
    FinishLocked(slot, false, std::move(err));
  }
  origins_[slot].task_returned = true;
  running_--;
  watch_cv_.notify_all();
}

void StreamAggregator::WatchDeadlines() {
  std::unique_lock<std::mutex> lock(mu_);
  while (!stopping_ && !AllTerminalLocked()) {
    auto earliest = Clock::time_point::max();
    for (const auto& o : origins_) {
      if (!IsTerminal(o.state)) earliest = std::min(earliest, o.deadline);
    }
    if (earliest == Clock::time_point::max()) {
      watch_cv_.wait(lock);
      continue;
    }
    if (Clock::now() < earliest) {
      watch_cv_.wait_until(lock, earliest);
      continue;
    }

    std::vector<CancelToken> expired;
    const auto now = Clock::now();
    for (size_t i = 0; i < origins_.size(); i++) {
      auto& o = origins_[i];
      if (IsTerminal(o.state) || o.deadline > now) continue;
      FinishLocked(i, false, MakeError(ErrorKind::kTimeout, o.id + ": deadline exceeded"));
      expired.push_back(o.cancel);
    }
    lock.unlock();
    for (const auto& t : expired) t.Cancel();
    lock.lock();
  }
}

void StreamAggregator::StopWatcher() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  watch_cv_.notify_all();
  std::lock_guard<std::mutex> join_lock(join_mu_);
  if (watcher_.joinable() && watcher_.get_id() != std::this_thread::get_id()) watcher_.join();
}

std::optional<ResultChunk> StreamAggregator::Next() {
  std::unique_lock<std::mutex> lock(mu_);
  chunk_cv_.wait(lock, [&] { return !queue_.empty() || AllTerminalLocked(); });
  if (queue_.empty()) return std::nullopt;
  ResultChunk c = std::move(queue_.front());
  queue_.pop_front();
  return c;
}

std::optional<ResultChunk> StreamAggregator::NextFor(std::chrono::milliseconds timeout, bool* finished) {
  std::unique_lock<std::mutex> lock(mu_);
  chunk_cv_.wait_for(lock, timeout, [&] { return !queue_.empty() || AllTerminalLocked(); });
  if (queue_.empty()) {
    if (finished) *finished = AllTerminalLocked();
    return std::nullopt;
  }
  if (finished) *finished = false;
  ResultChunk c = std::move(queue_.front());
  queue_.pop_front();
  return c;
}

void StreamAggregator::FailRemaining() {
  std::vector<CancelToken> tokens;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (size_t i = 0; i < origins_.size(); i++) {
      auto& o = origins_[i];
      if (!o.task_returned) tokens.push_back(o.cancel);
      if (!IsTerminal(o.state)) FinishLocked(i, false, MakeError(ErrorKind::kCancelled, o.id + ": cancelled by caller"));
    }
  }
  for (const auto& t : tokens) t.Cancel();
}

void StreamAggregator::Cancel() {
  FailRemaining();
  Wait();
}

void StreamAggregator::Wait() {
  {
    std::unique_lock<std::mutex> lock(mu_);
    if (!started_) return;
  }
  std::lock_guard<std::mutex> join_lock(join_mu_);
  for (auto& t : threads_) {
    if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
  }
}

OriginState StreamAggregator::State(const std::string& origin) const {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& o : origins_) {
    if (o.id == origin) return o.state;
  }
  return OriginState::kPending;
}

size_t StreamAggregator::RunningTasks() const {
  std::lock_guard<std::mutex> lock(mu_);
  return started_ ? running_ : 0;
}

}  // namespace gateway
