#pragma once

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace resumegen {

enum class ErrorKind {
  InvalidColor,
  BriefTooLong,
  UnsupportedModel,
  UnsupportedFormat,
  PayloadTooLarge,
  RateLimited,
  ConnectionError,
  Timeout,
  AuthenticationFailed,
  QuotaExceeded,
  MalformedRequest,
  RemoteError,
  UnexpectedResponse,
  RetriesExhausted,
  InvalidHTMLResponse,
  Cancelled,
  Configuration,
  FileNotFound,
};

/// Machine-readable name, e.g. "RateLimited".
const char* error_kind_name(ErrorKind kind);

/// Short end-user remediation hint for a failure kind.
const char* remediation_hint(ErrorKind kind);

/// True for transient failures eligible for backoff-and-retry.
bool is_retryable(ErrorKind kind);

class ResumeGenError : public std::runtime_error {
public:
  ResumeGenError(ErrorKind kind, const std::string& message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class APIError : public ResumeGenError {
public:
  APIError(ErrorKind kind,
           std::string message,
           long status_code,
           nlohmann::json error_body,
           std::map<std::string, std::string> headers)
      : ResumeGenError(kind, std::move(message)),
        status_code_(status_code),
        error_body_(std::move(error_body)),
        headers_(std::move(headers)) {}

  long status_code() const { return status_code_; }
  const nlohmann::json& error_body() const { return error_body_; }
  const std::map<std::string, std::string>& headers() const { return headers_; }

private:
  long status_code_;
  nlohmann::json error_body_;
  std::map<std::string, std::string> headers_;
};

class APIConnectionError : public ResumeGenError {
public:
  explicit APIConnectionError(const std::string& message)
      : ResumeGenError(ErrorKind::ConnectionError, message) {}

protected:
  APIConnectionError(ErrorKind kind, const std::string& message)
      : ResumeGenError(kind, message) {}
};

class APIConnectionTimeoutError : public APIConnectionError {
public:
  explicit APIConnectionTimeoutError(const std::string& message)
      : APIConnectionError(ErrorKind::Timeout, message) {}
};

class CancelledError : public ResumeGenError {
public:
  explicit CancelledError(const std::string& message)
      : ResumeGenError(ErrorKind::Cancelled, message) {}
};

class RetriesExhaustedError : public ResumeGenError {
public:
  RetriesExhaustedError(std::size_t attempts, ErrorKind last_cause, const std::string& last_message)
      : ResumeGenError(ErrorKind::RetriesExhausted,
                       "Gave up after " + std::to_string(attempts) + " attempts; last error (" +
                           error_kind_name(last_cause) + "): " + last_message),
        attempts_(attempts),
        last_cause_(last_cause),
        last_message_(last_message) {}

  std::size_t attempts() const { return attempts_; }
  ErrorKind last_cause() const { return last_cause_; }
  const std::string& last_message() const { return last_message_; }

private:
  std::size_t attempts_;
  ErrorKind last_cause_;
  std::string last_message_;
};

}  // namespace resumegen
