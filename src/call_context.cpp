#include "call_context.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace gateway {

struct CancelToken::State {
  std::mutex mu;
  std::condition_variable cv;
  bool cancelled = false;
  int next_id = 0;
  std::map<int, std::function<void()>> callbacks;
  // Ids taken out of `callbacks` by Cancel whose run has not returned yet.
  std::set<int> running;
  std::thread::id cancelling_thread;

  // Registration on the parent made by Child().
  std::weak_ptr<State> parent;
  int parent_callback = -1;

  ~State() {
    auto p = parent.lock();
    if (!p || parent_callback < 0) return;
    std::function<void()> dropped;
    std::lock_guard<std::mutex> lock(p->mu);
    auto it = p->callbacks.find(parent_callback);
    if (it == p->callbacks.end()) return;
    dropped = std::move(it->second);
    p->callbacks.erase(it);
  }
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::Cancel() const {
  std::vector<std::pair<int, std::function<void()>>> to_run;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (state_->cancelled) return;
    state_->cancelled = true;
    state_->cancelling_thread = std::this_thread::get_id();
    for (auto& [id, fn] : state_->callbacks) {
      state_->running.insert(id);
      to_run.emplace_back(id, std::move(fn));
    }
    state_->callbacks.clear();
  }
  state_->cv.notify_all();
  for (auto& [id, fn] : to_run) {
    if (fn) fn();
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->running.erase(id);
    }
    state_->cv.notify_all();
  }
}

bool CancelToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->cancelled;
}

bool CancelToken::WaitUntil(Clock::time_point deadline) const {
  std::unique_lock<std::mutex> lock(state_->mu);
  if (deadline == Clock::time_point::max()) {
    state_->cv.wait(lock, [&] { return state_->cancelled; });
    return true;
  }
  state_->cv.wait_until(lock, deadline, [&] { return state_->cancelled; });
  return state_->cancelled;
}

bool CancelToken::WaitFor(std::chrono::milliseconds timeout) const {
  return WaitUntil(Clock::now() + timeout);
}

int CancelToken::OnCancel(std::function<void()> fn) const {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (!state_->cancelled) {
      const int id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(fn));
      return id;
    }
  }
  if (fn) fn();
  return -1;
}

void CancelToken::RemoveCallback(int id) const {
  if (id < 0) return;
  // Destroyed after the lock is released.
  std::function<void()> dropped;
  std::unique_lock<std::mutex> lock(state_->mu);
  auto it = state_->callbacks.find(id);
  if (it != state_->callbacks.end()) {
    dropped = std::move(it->second);
    state_->callbacks.erase(it);
  }
  // A callback removing itself from inside Cancel must not wait on itself.
  if (state_->cancelling_thread == std::this_thread::get_id()) return;
  state_->cv.wait(lock, [&] { return state_->running.count(id) == 0; });
}

size_t CancelToken::PendingCallbacks() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->callbacks.size();
}

CancelToken CancelToken::Child() const {
  CancelToken child;
  std::weak_ptr<State> weak = child.state_;
  const int id = OnCancel([weak]() {
    auto s = weak.lock();
    if (!s) return;
    {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->cancelled) return;
    }
    CancelToken t;
    t.state_ = std::move(s);
    t.Cancel();
  });
  child.state_->parent = state_;
  child.state_->parent_callback = id;
  return child;
}

ScopedCancelCallback::ScopedCancelCallback(const CancelToken& token, std::function<void()> fn) : token_(token) {
  id_ = token_.OnCancel(std::move(fn));
}

ScopedCancelCallback::~ScopedCancelCallback() {
  token_.RemoveCallback(id_);
}

long long CallContext::RemainingMs() const {
  if (deadline == Clock::time_point::max()) return 24LL * 3600 * 1000;
  auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - Clock::now()).count();
  return left > 0 ? left : 0;
}

}  // namespace gateway
