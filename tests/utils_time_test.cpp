#include <gtest/gtest.h>

#include <chrono>

#include "resumegen/config.hpp"
#include "resumegen/utils/time.hpp"

using resumegen::RetryPolicy;
using resumegen::utils::calculate_retry_delay;
using resumegen::utils::elapsed_since;

TEST(UtilsTimeTest, RetryDelayUsesExponentialBackoff) {
  RetryPolicy policy;
  EXPECT_EQ(calculate_retry_delay(policy, /*retry_index=*/0), std::chrono::milliseconds(2000));
  EXPECT_EQ(calculate_retry_delay(policy, /*retry_index=*/1), std::chrono::milliseconds(4000));
  EXPECT_EQ(calculate_retry_delay(policy, /*retry_index=*/2), std::chrono::milliseconds(8000));
}

TEST(UtilsTimeTest, RetryDelayClampsToMaximum) {
  RetryPolicy policy;
  EXPECT_EQ(calculate_retry_delay(policy, /*retry_index=*/4), std::chrono::milliseconds(30000));
  EXPECT_EQ(calculate_retry_delay(policy, /*retry_index=*/5000), std::chrono::milliseconds(30000));
}

TEST(UtilsTimeTest, RetryDelayIsNonDecreasing) {
  RetryPolicy policy;
  policy.initial_delay = std::chrono::milliseconds(150);
  policy.backoff_multiplier = 1.5;
  policy.max_delay = std::chrono::milliseconds(1000);
  auto previous = calculate_retry_delay(policy, 0);
  for (std::size_t i = 1; i < 20; ++i) {
    auto current = calculate_retry_delay(policy, i);
    EXPECT_GE(current, previous) << "retry " << i;
    EXPECT_LE(current, policy.max_delay);
    previous = current;
  }
}

TEST(UtilsTimeTest, ZeroInitialDelayStaysZero) {
  RetryPolicy policy;
  policy.initial_delay = std::chrono::milliseconds(0);
  EXPECT_EQ(calculate_retry_delay(policy, 3), std::chrono::milliseconds(0));
}

TEST(UtilsTimeTest, ElapsedSinceIsNonNegative) {
  auto start = std::chrono::steady_clock::now();
  EXPECT_GE(elapsed_since(start), std::chrono::milliseconds(0));
  EXPECT_LE(elapsed_since(start), std::chrono::milliseconds(1000));
}
