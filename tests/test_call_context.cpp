#include <gtest/gtest.h>

#include "call_context.hpp"
#include "errors.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace gateway;
using namespace std::chrono_literals;

TEST(CancelTokenTest, CopiesShareState) {
  CancelToken a;
  CancelToken b = a;
  EXPECT_FALSE(b.IsCancelled());
  a.Cancel();
  EXPECT_TRUE(b.IsCancelled());
}

TEST(CancelTokenTest, WaitForTimesOutWithoutCancel) {
  CancelToken t;
  EXPECT_FALSE(t.WaitFor(5ms));
}

TEST(CancelTokenTest, WaitWakesOnCancel) {
  CancelToken t;
  std::thread canceller([t]() {
    std::this_thread::sleep_for(10ms);
    t.Cancel();
  });
  EXPECT_TRUE(t.WaitUntil(Clock::time_point::max()));
  canceller.join();
}

TEST(CancelTokenTest, CallbacksRunOnce) {
  CancelToken t;
  int calls = 0;
  t.OnCancel([&]() { calls++; });
  t.Cancel();
  t.Cancel();
  EXPECT_EQ(calls, 1);

  // Already cancelled: runs immediately.
  EXPECT_EQ(t.OnCancel([&]() { calls++; }), -1);
  EXPECT_EQ(calls, 2);
}

TEST(CancelTokenTest, ScopedCallbackIsRemoved) {
  CancelToken t;
  int calls = 0;
  { ScopedCancelCallback scoped(t, [&]() { calls++; }); }
  t.Cancel();
  EXPECT_EQ(calls, 0);
}

TEST(CancelTokenTest, ChildFollowsParentNotTheReverse) {
  CancelToken parent;
  CancelToken child = parent.Child();
  CancelToken sibling = parent.Child();

  child.Cancel();
  EXPECT_TRUE(child.IsCancelled());
  EXPECT_FALSE(parent.IsCancelled());
  EXPECT_FALSE(sibling.IsCancelled());

  parent.Cancel();
  EXPECT_TRUE(sibling.IsCancelled());

  CancelToken late = parent.Child();
  EXPECT_TRUE(late.IsCancelled());
}

// A callback touching an object owned by the registering scope must never run
// after that scope has released the object.
TEST(CancelTokenTest, ScopeExitWaitsForRunningCallback) {
  for (int i = 0; i < 500; i++) {
    CancelToken t;
    std::atomic<bool> alive{true};
    std::atomic<bool> used_after_release{false};
    std::thread canceller([t]() { t.Cancel(); });
    {
      ScopedCancelCallback scoped(t, [&alive, &used_after_release]() {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        if (!alive.load()) used_after_release = true;
      });
      if (i % 2) std::this_thread::yield();
    }
    alive = false;
    canceller.join();
    EXPECT_FALSE(used_after_release.load()) << "iteration " << i;
  }
}

TEST(CancelTokenTest, CallbackMayRemoveItselfWhileRunning) {
  CancelToken t;
  int id = -1;
  int calls = 0;
  id = t.OnCancel([&]() {
    calls++;
    t.RemoveCallback(id);
  });
  t.Cancel();
  EXPECT_EQ(calls, 1);
}

TEST(CancelTokenTest, DroppedChildUnregistersFromParent) {
  CancelToken parent;
  for (int i = 0; i < 100; i++) {
    CancelToken child = parent.Child();
    EXPECT_EQ(parent.PendingCallbacks(), 1u);
  }
  EXPECT_EQ(parent.PendingCallbacks(), 0u);

  CancelToken kept = parent.Child();
  parent.Cancel();
  EXPECT_TRUE(kept.IsCancelled());
}

TEST(CallContextTest, DeadlineAndRemaining) {
  CallContext ctx;
  EXPECT_FALSE(ctx.Expired());
  EXPECT_GT(ctx.RemainingMs(), 0);

  ctx.deadline = Clock::now() - 1ms;
  EXPECT_TRUE(ctx.Expired());
  EXPECT_EQ(ctx.RemainingMs(), 0);

  ctx.deadline = Clock::now() + 10s;
  EXPECT_GT(ctx.RemainingMs(), 5000);
}

TEST(ErrorsTest, KindsMapToHttpStatus) {
  EXPECT_EQ(HttpStatusForError(ErrorKind::kUnknownModel), 404);
  EXPECT_EQ(HttpStatusForError(ErrorKind::kInvalidTurns), 400);
  EXPECT_EQ(HttpStatusForError(ErrorKind::kBadRequest), 400);
  EXPECT_STREQ(ErrorKindName(ErrorKind::kBadRequest), "bad_request");
  EXPECT_STRNE(ErrorKindName(ErrorKind::kBadRequest), ErrorKindName(ErrorKind::kInvalidTurns));
  EXPECT_EQ(HttpStatusForError(ErrorKind::kBackend), 502);
  EXPECT_EQ(HttpStatusForError(ErrorKind::kMalformed), 502);
  EXPECT_EQ(HttpStatusForError(ErrorKind::kTimeout), 504);
  EXPECT_EQ(HttpStatusForError(ErrorKind::kCancelled), 499);

  auto e = MakeError(ErrorKind::kBackend, "upstream said no", 503);
  EXPECT_FALSE(e.ok());
  EXPECT_EQ(e.status, 503);
  EXPECT_TRUE(GatewayError{}.ok());
}
