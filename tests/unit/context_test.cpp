#include "internal/db/api/context.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>

namespace {

using wfstore::db::CancellationToken;
using wfstore::db::CancelSubscription;
using wfstore::db::Context;
using wfstore::db::ErrorCode;

void TestBackgroundNeverExpires() {
  auto ctx = Context::Background();
  assert(!ctx.Deadline().has_value());
  assert(!ctx.Remaining().has_value());
  assert(ctx.Check());
}

void TestDeadline() {
  auto expired = Context::WithTimeout(std::chrono::milliseconds(-5));
  assert(expired.IsExpired());
  assert(expired.Check().code == ErrorCode::DeadlineExceeded);
  assert(*expired.Remaining() == std::chrono::milliseconds(0));

  auto live = Context::WithTimeout(std::chrono::seconds(60));
  assert(!live.IsExpired());
  assert(live.Check());
  assert(*live.Remaining() > std::chrono::seconds(50));
}

void TestChildCannotExtendDeadline() {
  auto parent = Context::WithTimeout(std::chrono::seconds(1));
  auto child  = parent.WithDeadline(Context::Clock::now() + std::chrono::hours(1));
  assert(*child.Deadline() == *parent.Deadline());

  auto shorter = parent.WithDeadline(Context::Clock::now() - std::chrono::seconds(1));
  assert(shorter.IsExpired());
}

void TestCancellationWinsOverDeadline() {
  auto token = std::make_shared<CancellationToken>();
  auto ctx   = Context::WithTimeout(std::chrono::milliseconds(-1)).WithCancellation(token);
  assert(ctx.Check().code == ErrorCode::DeadlineExceeded);

  token->Cancel();
  assert(ctx.IsCancelled());
  assert(ctx.Check().code == ErrorCode::Cancelled);
}

void TestCallbacksRunOnce() {
  auto token = std::make_shared<CancellationToken>();
  int  calls = 0;
  {
    CancelSubscription sub(token, [&] { ++calls; });
    token->Cancel();
    token->Cancel();
  }
  assert(calls == 1);

  // subscribing to a cancelled token runs the callback right away
  int late = 0;
  {
    CancelSubscription sub(token, [&] { ++late; });
    assert(late == 1);
  }
  assert(late == 1);
}

void TestUnsubscribedCallbackNeverRuns() {
  auto token = std::make_shared<CancellationToken>();
  int  calls = 0;
  {
    CancelSubscription sub(token, [&] { ++calls; });
  }
  token->Cancel();
  assert(calls == 0);

  // null token: nothing to subscribe to
  CancelSubscription none(nullptr, [&] { ++calls; });
  assert(calls == 0);
}

} // namespace

int main() {
  TestBackgroundNeverExpires();
  TestDeadline();
  TestChildCannotExtendDeadline();
  TestCancellationWinsOverDeadline();
  TestCallbacksRunOnce();
  TestUnsubscribedCallbackNeverRuns();

  std::cout << "wfstore_unit_context: pass\n";
  return 0;
}
