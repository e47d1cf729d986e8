#include "internal/db/api/context.hpp"

#include <algorithm>
#include <utility>

namespace wfstore::db {

void CancellationToken::Cancel() {
  std::lock_guard lock(mutex_);
  if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  for (auto& [_, fn] : callbacks_) {
    fn();
  }
  callbacks_.clear();
}

std::uint64_t CancellationToken::Subscribe(std::function<void()> fn) {
  {
    std::lock_guard lock(mutex_);
    if (!cancelled_.load(std::memory_order_acquire)) {
      auto id = next_id_++;
      callbacks_.emplace(id, std::move(fn));
      return id;
    }
  }
  fn();
  return 0;
}

void CancellationToken::Unsubscribe(std::uint64_t id) {
  if (id == 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  callbacks_.erase(id);
}

CancelSubscription::CancelSubscription(std::shared_ptr<CancellationToken> token, std::function<void()> fn)
    : token_(std::move(token)) {
  if (token_) {
    id_ = token_->Subscribe(std::move(fn));
  }
}

CancelSubscription::~CancelSubscription() {
  if (token_) {
    token_->Unsubscribe(id_);
  }
}

Context Context::Background() {
  return {};
}

Context Context::WithTimeout(Clock::duration timeout) {
  return Background().WithDeadline(Clock::now() + timeout);
}

Context Context::WithDeadline(TimePoint deadline) const {
  Context ctx = *this;
  // a child context can only shorten its parent's deadline
  ctx.deadline_ = deadline_.has_value() ? std::min(*deadline_, deadline) : deadline;
  return ctx;
}

Context Context::WithCancellation(std::shared_ptr<CancellationToken> token) const {
  Context ctx = *this;
  ctx.token_  = std::move(token);
  return ctx;
}

bool Context::IsExpired() const {
  return deadline_.has_value() && Clock::now() >= *deadline_;
}

bool Context::IsCancelled() const {
  return token_ && token_->IsCancelled();
}

std::optional<std::chrono::milliseconds> Context::Remaining() const {
  if (!deadline_.has_value()) {
    return std::nullopt;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

Result Context::Check() const {
  if (IsCancelled()) {
    return Result::Err(ErrorCode::Cancelled, "context cancelled");
  }
  if (IsExpired()) {
    return Result::Err(ErrorCode::DeadlineExceeded, "context deadline exceeded");
  }
  return Result::Ok();
}

} // namespace wfstore::db
