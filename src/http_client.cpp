#include "resumegen/http_client.hpp"

#include "resumegen/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <string>

namespace resumegen {
namespace {

constexpr const char* kUserAgent = "resumegen/0.1";

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const size_t total = size * nmemb;
  body->append(ptr, total);
  return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);

    auto trim = [](std::string& s) {
      auto not_space = [](unsigned char ch) { return !std::isspace(static_cast<unsigned char>(ch)); };
      s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
      s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    };

    trim(key);
    trim(value);
    if (!key.empty()) {
      (*headers)[key] = value;
    }
  }

  return total_size;
}

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  auto* abort_requested = static_cast<const std::function<bool()>*>(clientp);
  return (*abort_requested)() ? 1 : 0;
}

struct CurlHandleDeleter {
  void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

[[noreturn]] void throw_transport_error(CURLcode code) {
  std::string message = std::string("libcurl error: ") + curl_easy_strerror(code);
  switch (code) {
    case CURLE_OPERATION_TIMEDOUT:
      throw APIConnectionTimeoutError(message);
    case CURLE_ABORTED_BY_CALLBACK:
      throw CancelledError("Request aborted by caller");
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      throw ResumeGenError(ErrorKind::Configuration, message);
    default:
      throw APIConnectionError(message);
  }
}

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
      throw APIConnectionError("Failed to initialize libcurl");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& [key, value] : request.headers) {
      std::string header = key + ": " + value;
      raw_list = curl_slist_append(raw_list, header.c_str());
    }
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw_list);

    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);

    if (request.abort_requested) {
      curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
      curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &request.abort_requested);
      curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    }

    if (!request.body.empty()) {
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
      curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
      throw_transport_error(res);
    }

    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);

    return HttpResponse{status_code, std::move(response_headers), std::move(response_body)};
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::shared_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_shared<CurlHttpClient>();
}

}  // namespace resumegen
