#include "resumegen/client.hpp"

#include "resumegen/error.hpp"
#include "resumegen/http_client.hpp"
#include "resumegen/utils/env.hpp"
#include "resumegen/utils/time.hpp"
#include "resumegen/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <set>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <utility>

namespace resumegen {
namespace {

using json = nlohmann::json;

constexpr const char* kDefaultBaseUrl = "https://api.openai.com/v1";
constexpr const char* kResponsesPath = "/responses";

template <typename>
inline constexpr bool kAlwaysFalse = false;

std::optional<std::string> get_header_value(const std::map<std::string, std::string>& headers,
                                            std::string_view key) {
  for (const auto& [name, value] : headers) {
    if (utils::iequals(name, key)) {
      return value;
    }
  }
  return std::nullopt;
}

std::optional<std::chrono::milliseconds> parse_delay(const std::string& value,
                                                     double scale,
                                                     std::chrono::milliseconds cap) {
  char* end = nullptr;
  double parsed = std::strtod(value.c_str(), &end);
  if (end == value.c_str() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  if (parsed < 0) {
    return std::chrono::milliseconds(0);
  }
  const double millis = std::min(parsed * scale, static_cast<double>(cap.count()));
  return std::chrono::milliseconds(static_cast<long long>(millis));
}

/// Server-requested delay, clamped to `cap`; nullopt when absent or not a finite number.
std::optional<std::chrono::milliseconds> parse_retry_after(const std::map<std::string, std::string>& headers,
                                                           std::chrono::milliseconds cap) {
  if (auto retry_after_ms = get_header_value(headers, "retry-after-ms")) {
    if (auto parsed = parse_delay(*retry_after_ms, 1.0, cap)) {
      return parsed;
    }
  }
  if (auto retry_after = get_header_value(headers, "retry-after")) {
    return parse_delay(*retry_after, 1000.0, cap);
  }
  return std::nullopt;
}

std::string extract_error_message(const json& payload) {
  if (payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_object()) {
      return err.value("message", "");
    }
    if (err.is_string()) {
      return err.get<std::string>();
    }
  }
  return {};
}

std::string extract_error_code(const json& error) {
  for (const char* field : {"code", "type"}) {
    if (error.contains(field) && error.at(field).is_string()) {
      const auto value = error.at(field).get<std::string>();
      if (!value.empty()) {
        return value;
      }
    }
  }
  return {};
}

json extract_error_payload(const json& payload) {
  if (payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_object()) {
      return err;
    }
  }
  return payload;
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    sanitized[key] = kSensitive.count(utils::to_lower(key)) ? "***" : value;
  }
  return sanitized;
}

json content_block_to_json(const ContentBlock& block) {
  return std::visit(
      [](const auto& value) -> json {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, TextBlock>) {
          return json{{"type", "input_text"}, {"text", value.text}};
        } else if constexpr (std::is_same_v<T, InlineImageBlock>) {
          return json{{"type", "input_image"}, {"image_url", value.data_uri}};
        } else if constexpr (std::is_same_v<T, InlineFileBlock>) {
          return json{{"type", "input_file"}, {"filename", value.filename}, {"file_data", value.data_uri}};
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled content block");
        }
      },
      block);
}

struct RetryableCause {
  ErrorKind kind;
  std::string message;
  long status_code;
  std::optional<std::chrono::milliseconds> retry_after;
};

[[noreturn]] void throw_permanent(const PermanentFailure& failure) {
  if (failure.status_code > 0) {
    throw APIError(failure.kind, failure.message, failure.status_code, failure.error_body, failure.headers);
  }
  throw ResumeGenError(failure.kind, failure.message);
}

}  // namespace

ErrorKind ErrorClassifier::classify(long status_code, const std::string& error_code) const {
  if (!error_code.empty() && quota_error_codes.count(error_code) > 0) {
    return ErrorKind::QuotaExceeded;
  }
  auto it = status_kinds.find(status_code);
  if (it != status_kinds.end()) {
    return it->second;
  }
  return fallback;
}

json build_request_body(const GenerationRequest& request) {
  json input = json::array();
  if (!request.system_instructions.empty()) {
    input.push_back(json{{"role", "developer"},
                         {"content", json::array({json{{"type", "input_text"}, {"text", request.system_instructions}}})}});
  }

  json content = json::array();
  for (const auto& block : request.content) {
    content.push_back(content_block_to_json(block));
  }
  if (!content.empty()) {
    input.push_back(json{{"role", "user"}, {"content", std::move(content)}});
  }

  json body;
  body["model"] = request.model;
  body["input"] = std::move(input);
  body["temperature"] = request.temperature;
  body["max_output_tokens"] = request.max_tokens;
  return body;
}

std::optional<std::string> extract_output_text(const json& payload) {
  if (payload.contains("output_text") && payload.at("output_text").is_string()) {
    return payload.at("output_text").get<std::string>();
  }
  if (!payload.contains("output") || !payload.at("output").is_array()) {
    return std::nullopt;
  }
  std::ostringstream stream;
  bool found = false;
  for (const auto& item : payload.at("output")) {
    if (!item.is_object() || item.value("type", std::string{}) != "message") {
      continue;
    }
    if (!item.contains("content") || !item.at("content").is_array()) {
      continue;
    }
    for (const auto& segment : item.at("content")) {
      if (segment.is_object() && segment.value("type", std::string{}) == "output_text") {
        stream << segment.value("text", std::string{});
        found = true;
      }
    }
  }
  if (!found) {
    return std::nullopt;
  }
  return stream.str();
}

std::string redact_api_key(const std::string& api_key) {
  if (api_key.size() <= 12) {
    return "***";
  }
  return api_key.substr(0, 8) + "..." + api_key.substr(api_key.size() - 4);
}

ResilientClient::ResilientClient(ClientOptions options, std::shared_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()) {
  if (options_.api_key.empty()) {
    if (auto env_api = utils::read_env("OPENAI_API_KEY")) {
      options_.api_key = *env_api;
    }
  }

  if (options_.base_url == kDefaultBaseUrl || options_.base_url.empty()) {
    options_.base_url = utils::read_env("OPENAI_BASE_URL").value_or(kDefaultBaseUrl);
  }
  while (!options_.base_url.empty() && options_.base_url.back() == '/') {
    options_.base_url.pop_back();
  }

  if (!options_.organization) {
    if (auto env_org = utils::read_env("OPENAI_ORG_ID")) {
      options_.organization = *env_org;
    }
  }

  if (!options_.project) {
    if (auto env_project = utils::read_env("OPENAI_PROJECT_ID")) {
      options_.project = *env_project;
    }
  }

  if (options_.log_level == LogLevel::Off) {
    if (auto env_log = utils::read_env("RESUMEGEN_LOG")) {
      options_.log_level = parse_log_level(*env_log, options_.log_level);
    }
  }

  if (options_.api_key.empty()) {
    throw ResumeGenError(ErrorKind::Configuration,
                         "Missing API key. Provide ClientOptions.api_key or set the OPENAI_API_KEY environment variable.");
  }
  if (options_.timeout.count() <= 0) {
    throw ResumeGenError(ErrorKind::Configuration, "ClientOptions.timeout must be positive");
  }
  const auto& policy = options_.retry_policy;
  if (policy.max_attempts == 0) {
    throw ResumeGenError(ErrorKind::Configuration, "RetryPolicy.max_attempts must be at least 1");
  }
  if (policy.initial_delay.count() < 0 || policy.max_delay < policy.initial_delay) {
    throw ResumeGenError(ErrorKind::Configuration, "RetryPolicy delays must satisfy 0 <= initial_delay <= max_delay");
  }
  if (policy.backoff_multiplier <= 1.0) {
    throw ResumeGenError(ErrorKind::Configuration, "RetryPolicy.backoff_multiplier must be greater than 1");
  }

  log(LogLevel::Debug, "client configured",
      {{"base_url", options_.base_url},
       {"api_key", redact_api_key(options_.api_key)},
       {"timeout_ms", options_.timeout.count()},
       {"max_attempts", policy.max_attempts}});
}

void ResilientClient::log(LogLevel level, const std::string& message, const json& details) const {
  if (!options_.logger) {
    return;
  }
  if (static_cast<int>(level) > static_cast<int>(options_.log_level)) {
    return;
  }
  options_.logger(level, message, details);
}

HttpRequest ResilientClient::build_http_request(const std::string& body,
                                                std::size_t attempt,
                                                const CancellationToken& cancellation) const {
  HttpRequest http_request;
  http_request.method = "POST";
  http_request.url = options_.base_url + kResponsesPath;
  http_request.body = body;
  http_request.timeout = options_.timeout;
  http_request.abort_requested = [cancellation] { return cancellation.is_cancelled(); };

  std::map<std::string, std::string> headers;
  headers["Accept"] = "application/json";
  headers["Content-Type"] = "application/json";
  headers["Authorization"] = "Bearer " + options_.api_key;
  headers["X-Retry-Count"] = std::to_string(attempt - 1);
  if (options_.organization) {
    headers["OpenAI-Organization"] = *options_.organization;
  }
  if (options_.project) {
    headers["OpenAI-Project"] = *options_.project;
  }
  for (const auto& [key, value] : options_.default_headers) {
    headers[key] = value;
  }
  http_request.headers = std::move(headers);
  return http_request;
}

DispatchOutcome ResilientClient::dispatch(const HttpRequest& request) const {
  HttpResponse response;
  try {
    response = http_client_->request(request);
  } catch (const CancelledError& error) {
    return CancelledFailure{error.what()};
  } catch (const APIConnectionTimeoutError& error) {
    return TimeoutFailure{error.what(), 0, std::nullopt};
  } catch (const APIConnectionError& error) {
    return ConnectionFailure{error.what(), 0, std::nullopt};
  } catch (const ResumeGenError& error) {
    return PermanentFailure{error.kind(), error.what(), 0, json::object(), {}};
  } catch (const std::exception& error) {
    return PermanentFailure{ErrorKind::RemoteError, std::string("Transport failed: ") + error.what(), 0,
                            json::object(), {}};
  }
  return classify_response(response);
}

DispatchOutcome ResilientClient::classify_response(const HttpResponse& response) const {
  const auto payload = utils::safe_json(response.body);

  if (response.status_code >= 200 && response.status_code < 300) {
    if (!payload || !payload->is_object()) {
      return PermanentFailure{ErrorKind::UnexpectedResponse, "Response body is not a JSON object",
                              response.status_code, json::object(), response.headers};
    }
    if (payload->contains("error") && payload->at("error").is_object()) {
      const std::string message = extract_error_message(*payload);
      return PermanentFailure{ErrorKind::RemoteError, message.empty() ? "Generation failed" : message,
                              response.status_code, extract_error_payload(*payload), response.headers};
    }
    auto text = extract_output_text(*payload);
    if (!text) {
      return PermanentFailure{ErrorKind::UnexpectedResponse, "Response contains no output text",
                              response.status_code, *payload, response.headers};
    }
    DispatchSuccess success{std::move(*text), response.status_code, std::nullopt};
    if (payload->value("status", std::string{}) == "incomplete") {
      std::string reason = "unknown";
      if (payload->contains("incomplete_details") && payload->at("incomplete_details").is_object()) {
        reason = payload->at("incomplete_details").value("reason", reason);
      }
      success.incomplete_reason = reason;
    }
    return success;
  }

  json error_body = json::object();
  std::string message;
  std::string code;
  if (payload) {
    message = extract_error_message(*payload);
    error_body = extract_error_payload(*payload);
    if (error_body.is_object()) {
      code = extract_error_code(error_body);
    }
  }
  if (message.empty()) {
    message = "HTTP " + std::to_string(response.status_code) + " error";
  }

  const ErrorKind kind = options_.classifier.classify(response.status_code, code);
  const auto retry_after = parse_retry_after(response.headers, options_.retry_policy.max_delay);
  switch (kind) {
    case ErrorKind::RateLimited:
      return RateLimitedFailure{message, response.status_code, retry_after};
    case ErrorKind::ConnectionError:
      return ConnectionFailure{message, response.status_code, retry_after};
    case ErrorKind::Timeout:
      return TimeoutFailure{message, response.status_code, retry_after};
    default:
      return PermanentFailure{kind, message, response.status_code, error_body, response.headers};
  }
}

DispatchResult ResilientClient::execute(const GenerationRequest& request, const CancellationToken& cancellation) const {
  const std::string body = build_request_body(request).dump();
  const RetryPolicy& policy = options_.retry_policy;
  const auto started = std::chrono::steady_clock::now();
  std::chrono::milliseconds previous_delay{0};

  for (std::size_t attempt = 1;; ++attempt) {
    if (cancellation.is_cancelled()) {
      log(LogLevel::Warn, "request cancelled", {{"attempt", attempt}});
      throw CancelledError("Generation cancelled before attempt " + std::to_string(attempt));
    }

    HttpRequest http_request = build_http_request(body, attempt, cancellation);
    log(LogLevel::Debug, "sending request",
        {{"method", http_request.method},
         {"url", http_request.url},
         {"attempt", attempt},
         {"model", request.model},
         {"headers", sanitize_headers(http_request.headers)}});
    const auto attempt_started = std::chrono::steady_clock::now();
    DispatchOutcome outcome = dispatch(http_request);

    std::optional<DispatchResult> result;
    std::optional<RetryableCause> cause = std::visit(
        [&](auto& value) -> std::optional<RetryableCause> {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, DispatchSuccess>) {
            log(LogLevel::Info, "request succeeded",
                {{"attempt", attempt},
                 {"status", value.status_code},
                 {"duration_ms", utils::elapsed_since(attempt_started).count()},
                 {"output_chars", value.output_text.size()}});
            if (value.incomplete_reason) {
              log(LogLevel::Warn, "response incomplete", {{"reason", *value.incomplete_reason}});
            }
            result = DispatchResult{std::move(value.output_text), attempt, value.status_code,
                                    utils::elapsed_since(started), std::move(value.incomplete_reason)};
            return std::nullopt;
          } else if constexpr (std::is_same_v<T, RateLimitedFailure>) {
            return RetryableCause{ErrorKind::RateLimited, value.message, value.status_code, value.retry_after};
          } else if constexpr (std::is_same_v<T, ConnectionFailure>) {
            return RetryableCause{ErrorKind::ConnectionError, value.message, value.status_code, value.retry_after};
          } else if constexpr (std::is_same_v<T, TimeoutFailure>) {
            return RetryableCause{ErrorKind::Timeout, value.message, value.status_code, value.retry_after};
          } else if constexpr (std::is_same_v<T, CancelledFailure>) {
            log(LogLevel::Warn, "request cancelled", {{"attempt", attempt}});
            throw CancelledError(value.message);
          } else if constexpr (std::is_same_v<T, PermanentFailure>) {
            log(LogLevel::Error, "request failed",
                {{"attempt", attempt},
                 {"status", value.status_code},
                 {"kind", error_kind_name(value.kind)},
                 {"message", value.message},
                 {"response_headers", sanitize_headers(value.headers)}});
            throw_permanent(value);
          } else {
            static_assert(kAlwaysFalse<T>, "unhandled dispatch outcome");
          }
        },
        outcome);

    if (result) {
      return std::move(*result);
    }

    if (attempt >= policy.max_attempts) {
      log(LogLevel::Error, "retries exhausted",
          {{"attempts", attempt}, {"kind", error_kind_name(cause->kind)}, {"message", cause->message}});
      throw RetriesExhaustedError(attempt, cause->kind, cause->message);
    }

    std::chrono::milliseconds delay = utils::calculate_retry_delay(policy, attempt - 1);
    delay = std::max(delay, previous_delay);
    if (cause->retry_after) {
      delay = std::max(delay, std::min(*cause->retry_after, policy.max_delay));
    }
    previous_delay = delay;

    log(LogLevel::Warn, "retrying request",
        {{"attempt", attempt},
         {"max_attempts", policy.max_attempts},
         {"delay_ms", delay.count()},
         {"kind", error_kind_name(cause->kind)},
         {"status", cause->status_code},
         {"message", cause->message}});

    if (!cancellation.wait_for(delay)) {
      log(LogLevel::Warn, "request cancelled", {{"attempt", attempt}, {"during", "backoff"}});
      throw CancelledError("Generation cancelled while waiting to retry after " + std::string(error_kind_name(cause->kind)));
    }
  }
}

}  // namespace resumegen
