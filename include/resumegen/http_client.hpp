#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace resumegen {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{120000};
  /// Polled during the transfer; returning true aborts it with CancelledError.
  std::function<bool()> abort_requested;
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Blocking transport. Implementations must be safe for concurrent calls.
 *
 * `request` returns any HTTP response, including error statuses. Transport
 * failures are thrown: APIConnectionTimeoutError when `timeout` elapses,
 * APIConnectionError for DNS/connect/reset failures, CancelledError when
 * `abort_requested` fires.
 */
class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;
};

std::shared_ptr<HttpClient> make_default_http_client();

}  // namespace resumegen
