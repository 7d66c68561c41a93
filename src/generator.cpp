#include "resumegen/generator.hpp"

#include "resumegen/error.hpp"

#include <utility>

namespace resumegen {

ClientOptions make_client_options(const GeneratorConfig& config) {
  ClientOptions options;
  options.timeout = config.api_timeout;
  options.retry_policy = config.retry_policy();
  return options;
}

ResumeGenerator::ResumeGenerator(GeneratorConfig config,
                                 ClientOptions client_options,
                                 std::shared_ptr<HttpClient> http_client)
    : builder_(std::move(config)), client_(std::move(client_options), std::move(http_client)) {}

GenerationResult ResumeGenerator::generate(const GenerationInput& input, const CancellationToken& cancellation) const {
  GenerationRequest request = builder_.build(input);
  DispatchResult dispatched = client_.execute(request, cancellation);
  validator_.validate(dispatched.output_text);

  GenerationResult result;
  result.html = std::move(dispatched.output_text);
  result.attempts = dispatched.attempts;
  result.elapsed = dispatched.elapsed;
  result.model = request.model;
  return result;
}

}  // namespace resumegen
