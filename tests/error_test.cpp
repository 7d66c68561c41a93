#include <gtest/gtest.h>

#include "resumegen/error.hpp"

#include <string>

using resumegen::ErrorKind;

TEST(ErrorTest, OnlyTransientKindsAreRetryable) {
  EXPECT_TRUE(resumegen::is_retryable(ErrorKind::RateLimited));
  EXPECT_TRUE(resumegen::is_retryable(ErrorKind::ConnectionError));
  EXPECT_TRUE(resumegen::is_retryable(ErrorKind::Timeout));
  EXPECT_FALSE(resumegen::is_retryable(ErrorKind::AuthenticationFailed));
  EXPECT_FALSE(resumegen::is_retryable(ErrorKind::QuotaExceeded));
  EXPECT_FALSE(resumegen::is_retryable(ErrorKind::MalformedRequest));
  EXPECT_FALSE(resumegen::is_retryable(ErrorKind::InvalidHTMLResponse));
  EXPECT_FALSE(resumegen::is_retryable(ErrorKind::Cancelled));
}

TEST(ErrorTest, NamesAndHints) {
  EXPECT_STREQ(resumegen::error_kind_name(ErrorKind::PayloadTooLarge), "PayloadTooLarge");
  EXPECT_STREQ(resumegen::remediation_hint(ErrorKind::PayloadTooLarge), "File too large; upload a smaller file.");
  EXPECT_STREQ(resumegen::remediation_hint(ErrorKind::RateLimited), "Rate limited, please retry shortly.");
}

TEST(ErrorTest, ConnectionErrorsCarryTheirKind) {
  resumegen::APIConnectionError connection("reset");
  resumegen::APIConnectionTimeoutError timeout("timed out");
  EXPECT_EQ(connection.kind(), ErrorKind::ConnectionError);
  EXPECT_EQ(timeout.kind(), ErrorKind::Timeout);

  const resumegen::APIConnectionError& as_base = timeout;
  EXPECT_EQ(as_base.kind(), ErrorKind::Timeout);
}

TEST(ErrorTest, RetriesExhaustedDescribesLastCause) {
  resumegen::RetriesExhaustedError error(4, ErrorKind::RateLimited, "Rate limit reached");
  EXPECT_EQ(error.kind(), ErrorKind::RetriesExhausted);
  EXPECT_EQ(std::string(error.what()), "Gave up after 4 attempts; last error (RateLimited): Rate limit reached");
}
