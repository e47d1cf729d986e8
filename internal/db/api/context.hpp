#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/db/api/result.hpp"

namespace wfstore::db {

/*
  CancellationToken

  Shared between a caller and the statements it issues. Cancel() flips the
  flag and runs every registered callback exactly once.

  Callbacks run under the token mutex, so Unsubscribe() returning means the
  callback is not running and will never run. A callback must not call back
  into the token.
*/
class CancellationToken {
 public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&)            = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void Cancel();
  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Runs fn immediately (and returns 0) when already cancelled.
  std::uint64_t Subscribe(std::function<void()> fn);
  void          Unsubscribe(std::uint64_t id);

 private:
  std::mutex                                               mutex_;
  std::atomic<bool>                                        cancelled_{false};
  std::uint64_t                                            next_id_ = 1;
  std::unordered_map<std::uint64_t, std::function<void()>> callbacks_;
};

/*
  RAII registration of a cancel callback for the lifetime of one statement.
*/
class CancelSubscription {
 public:
  CancelSubscription(std::shared_ptr<CancellationToken> token, std::function<void()> fn);
  ~CancelSubscription();

  CancelSubscription(const CancelSubscription&)            = delete;
  CancelSubscription& operator=(const CancelSubscription&) = delete;

 private:
  std::shared_ptr<CancellationToken> token_;
  std::uint64_t                      id_ = 0;
};

/*
  Context

  Per-call deadline + cancellation. Passed by const reference to every store
  operation; backends must stop the in-flight statement once either fires.
*/
class Context {
 public:
  using Clock     = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;

  static Context Background();
  static Context WithTimeout(Clock::duration timeout);

  Context WithDeadline(TimePoint deadline) const;
  Context WithCancellation(std::shared_ptr<CancellationToken> token) const;

  const std::optional<TimePoint>&           Deadline() const { return deadline_; }
  const std::shared_ptr<CancellationToken>& Token() const { return token_; }

  bool IsExpired() const;
  bool IsCancelled() const;

  // Time left before the deadline; nullopt when there is none.
  std::optional<std::chrono::milliseconds> Remaining() const;

  // OK, DeadlineExceeded or Cancelled.
  Result Check() const;

 private:
  std::optional<TimePoint>           deadline_;
  std::shared_ptr<CancellationToken> token_;
};

} // namespace wfstore::db
