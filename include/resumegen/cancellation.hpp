#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace resumegen {

/**
 * Caller-owned cancellation signal with an optional deadline.
 *
 * Copies share state: cancelling any copy cancels all of them. A token is
 * considered cancelled once `cancel()` was called or its deadline passed.
 * A default-constructed token never cancels on its own.
 */
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  CancellationToken();

  static CancellationToken with_deadline(Clock::time_point deadline);
  static CancellationToken with_timeout(std::chrono::milliseconds timeout);

  void cancel() const;

  bool is_cancelled() const;

  std::optional<Clock::time_point> deadline() const;

  /// Time left before the deadline, or nullopt when there is none.
  std::optional<std::chrono::milliseconds> remaining() const;

  /**
   * Blocks for `duration` unless cancelled first.
   * Returns true when the full duration elapsed, false when interrupted.
   */
  bool wait_for(std::chrono::milliseconds duration) const;

private:
  struct State {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::optional<Clock::time_point> deadline;
  };

  std::shared_ptr<State> state_;
};

}  // namespace resumegen
