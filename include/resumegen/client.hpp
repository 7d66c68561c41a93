#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "resumegen/cancellation.hpp"
#include "resumegen/config.hpp"
#include "resumegen/error.hpp"
#include "resumegen/http_client.hpp"
#include "resumegen/logging.hpp"
#include "resumegen/request_builder.hpp"

namespace resumegen {

/**
 * Maps remote error responses onto ErrorKind. The table decides which
 * statuses are retried (those mapping to RateLimited, ConnectionError or
 * Timeout); callers may edit it when the remote taxonomy changes.
 */
struct ErrorClassifier {
  std::map<long, ErrorKind> status_kinds = {
      {400, ErrorKind::MalformedRequest},
      {401, ErrorKind::AuthenticationFailed},
      {403, ErrorKind::AuthenticationFailed},
      {408, ErrorKind::Timeout},
      {413, ErrorKind::PayloadTooLarge},
      {422, ErrorKind::MalformedRequest},
      {429, ErrorKind::RateLimited},
      {502, ErrorKind::ConnectionError},
      {503, ErrorKind::ConnectionError},
      {504, ErrorKind::Timeout},
  };
  /// Remote `error.code`/`error.type` values that mean the quota is gone for good.
  std::set<std::string> quota_error_codes = {"insufficient_quota"};
  ErrorKind fallback = ErrorKind::RemoteError;

  ErrorKind classify(long status_code, const std::string& error_code) const;
};

struct ClientOptions {
  std::string api_key;
  std::optional<std::string> organization;
  std::optional<std::string> project;
  std::string base_url = "https://api.openai.com/v1";
  std::chrono::milliseconds timeout{120000};
  RetryPolicy retry_policy;
  ErrorClassifier classifier;
  std::map<std::string, std::string> default_headers;
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

struct DispatchSuccess {
  std::string output_text;
  long status_code = 0;
  std::optional<std::string> incomplete_reason;
};

struct RateLimitedFailure {
  std::string message;
  long status_code = 0;
  std::optional<std::chrono::milliseconds> retry_after;
};

struct ConnectionFailure {
  std::string message;
  long status_code = 0;
  std::optional<std::chrono::milliseconds> retry_after;
};

struct TimeoutFailure {
  std::string message;
  long status_code = 0;
  std::optional<std::chrono::milliseconds> retry_after;
};

struct CancelledFailure {
  std::string message;
};

struct PermanentFailure {
  ErrorKind kind = ErrorKind::RemoteError;
  std::string message;
  long status_code = 0;
  nlohmann::json error_body = nlohmann::json::object();
  std::map<std::string, std::string> headers;
};

/// Classified result of a single physical attempt.
using DispatchOutcome = std::variant<DispatchSuccess,
                                     RateLimitedFailure,
                                     ConnectionFailure,
                                     TimeoutFailure,
                                     CancelledFailure,
                                     PermanentFailure>;

struct DispatchResult {
  std::string output_text;
  std::size_t attempts = 0;
  long status_code = 0;
  std::chrono::milliseconds elapsed{0};
  std::optional<std::string> incomplete_reason;
};

/// JSON body for the responses endpoint.
nlohmann::json build_request_body(const GenerationRequest& request);

/// Concatenated `output_text` segments of a response payload, or nullopt when there are none.
std::optional<std::string> extract_output_text(const nlohmann::json& payload);

/// `sk-abcdef...wxyz`, or `***` for keys of 12 characters or fewer.
std::string redact_api_key(const std::string& api_key);

/**
 * Executes generation requests with bounded exponential backoff.
 *
 * One logical call makes up to `retry_policy.max_attempts` physical
 * attempts. RateLimited, ConnectionError and Timeout outcomes are retried
 * after a delay that starts at `initial_delay` and doubles up to
 * `max_delay`; every other failure is thrown on first occurrence. When the
 * attempts run out a RetriesExhaustedError wrapping the last cause is
 * thrown. The cancellation token aborts both the in-flight request and a
 * pending backoff wait with CancelledError.
 *
 * Holds no per-request state: one instance, and its transport, can serve
 * concurrent calls.
 */
class ResilientClient {
public:
  explicit ResilientClient(ClientOptions options, std::shared_ptr<HttpClient> http_client = nullptr);

  const ClientOptions& options() const { return options_; }

  DispatchResult execute(const GenerationRequest& request,
                         const CancellationToken& cancellation = CancellationToken()) const;

private:
  HttpRequest build_http_request(const std::string& body,
                                 std::size_t attempt,
                                 const CancellationToken& cancellation) const;
  DispatchOutcome dispatch(const HttpRequest& request) const;
  DispatchOutcome classify_response(const HttpResponse& response) const;
  void log(LogLevel level, const std::string& message, const nlohmann::json& details = nlohmann::json::object()) const;

  ClientOptions options_;
  std::shared_ptr<HttpClient> http_client_;
};

}  // namespace resumegen
