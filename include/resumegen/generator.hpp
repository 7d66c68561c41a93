#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "resumegen/cancellation.hpp"
#include "resumegen/client.hpp"
#include "resumegen/config.hpp"
#include "resumegen/request_builder.hpp"
#include "resumegen/response_validator.hpp"

namespace resumegen {

struct GenerationResult {
  std::string html;
  std::size_t attempts = 0;
  std::chrono::milliseconds elapsed{0};
  std::string model;
};

/**
 * Entry point for the presentation layer: validates the submission, sends
 * it through the resilient client and checks the returned document.
 *
 * Every failure surfaces as a ResumeGenError whose kind() identifies the
 * cause; there is no fallback output. Stateless per call, so a single
 * instance may serve concurrent submissions.
 */
class ResumeGenerator {
public:
  ResumeGenerator(GeneratorConfig config, ClientOptions client_options, std::shared_ptr<HttpClient> http_client = nullptr);

  const GeneratorConfig& config() const { return builder_.config(); }
  const ResilientClient& client() const { return client_; }

  GenerationResult generate(const GenerationInput& input,
                            const CancellationToken& cancellation = CancellationToken()) const;

private:
  RequestBuilder builder_;
  ResilientClient client_;
  ResponseValidator validator_;
};

/// Client options derived from the generator config: timeout and retry policy.
ClientOptions make_client_options(const GeneratorConfig& config);

}  // namespace resumegen
