#pragma once

#include <chrono>
#include <cstddef>

namespace resumegen {
struct RetryPolicy;
}

namespace resumegen::utils {

/**
 * Backoff delay before retry number `retry_index` (0 for the first retry):
 * `initial_delay * multiplier^retry_index`, clamped to `[0, max_delay]`.
 */
std::chrono::milliseconds calculate_retry_delay(const RetryPolicy& policy, std::size_t retry_index);

/// Milliseconds elapsed since `start` on the steady clock.
std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start);

}  // namespace resumegen::utils
