#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace gateway {

using Clock = std::chrono::steady_clock;

// Shared cancellation flag. Copies refer to the same state.
class CancelToken {
 public:
  CancelToken();

  void Cancel() const;
  bool IsCancelled() const;

  // Blocks until cancelled or the deadline passes. Returns true if cancelled.
  bool WaitUntil(Clock::time_point deadline) const;
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // The callback runs once, on the cancelling thread, or immediately when the
  // token is already cancelled. Returns an id for RemoveCallback.
  int OnCancel(std::function<void()> fn) const;
  // Unregisters the callback. If Cancel is running it on another thread,
  // blocks until that run has returned.
  void RemoveCallback(int id) const;
  size_t PendingCallbacks() const;

  // A token that is cancelled together with this one but can also be
  // cancelled on its own. Its registration on this token is dropped when the
  // last copy of the child goes away.
  CancelToken Child() const;

 private:
  struct State;
  std::shared_ptr<State> state_;
};

// Unregisters a cancel callback when leaving scope.
class ScopedCancelCallback {
 public:
  ScopedCancelCallback(const CancelToken& token, std::function<void()> fn);
  ~ScopedCancelCallback();

  ScopedCancelCallback(const ScopedCancelCallback&) = delete;
  ScopedCancelCallback& operator=(const ScopedCancelCallback&) = delete;

 private:
  CancelToken token_;
  int id_ = -1;
};

struct CallContext {
  CancelToken cancel;
  Clock::time_point deadline = Clock::time_point::max();

  bool Expired() const { return Clock::now() >= deadline; }
  // Milliseconds left before the deadline, rounded up, never negative.
  long long RemainingMs() const;
};

}  // namespace gateway
