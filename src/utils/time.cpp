#include "resumegen/utils/time.hpp"

#include "resumegen/config.hpp"

#include <cmath>

namespace resumegen::utils {

std::chrono::milliseconds calculate_retry_delay(const RetryPolicy& policy, std::size_t retry_index) {
  const double initial = static_cast<double>(policy.initial_delay.count());
  const double cap = static_cast<double>(policy.max_delay.count());
  double delay = initial * std::pow(policy.backoff_multiplier, static_cast<double>(retry_index));
  if (!std::isfinite(delay) || delay > cap) {
    delay = cap;
  }
  if (delay < 0.0) {
    delay = 0.0;
  }
  return std::chrono::milliseconds(static_cast<long long>(delay));
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

}  // namespace resumegen::utils
