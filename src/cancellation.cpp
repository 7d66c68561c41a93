#include "resumegen/cancellation.hpp"

#include <algorithm>

namespace resumegen {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

CancellationToken CancellationToken::with_deadline(Clock::time_point deadline) {
  CancellationToken token;
  token.state_->deadline = deadline;
  return token;
}

CancellationToken CancellationToken::with_timeout(std::chrono::milliseconds timeout) {
  return with_deadline(Clock::now() + timeout);
}

void CancellationToken::cancel() const {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::is_cancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->cancelled) {
    return true;
  }
  return state_->deadline && Clock::now() >= *state_->deadline;
}

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->deadline;
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
  auto limit = deadline();
  if (!limit) {
    return std::nullopt;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*limit - Clock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(state_->mutex);
  auto wake_at = Clock::now() + std::max(duration, std::chrono::milliseconds(0));
  const bool deadline_first = state_->deadline && *state_->deadline < wake_at;
  if (deadline_first) {
    wake_at = *state_->deadline;
  }
  state_->cv.wait_until(lock, wake_at, [this] { return state_->cancelled; });
  if (state_->cancelled) {
    return false;
  }
  return !deadline_first;
}

}  // namespace resumegen
