#include "resumegen/request_builder.hpp"

#include "resumegen/error.hpp"
#include "resumegen/utils/values.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace resumegen {
namespace {

constexpr double kMinTemperature = 0.0;
constexpr double kMaxTemperature = 2.0;

std::regex compile_color_pattern(const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    throw ResumeGenError(ErrorKind::Configuration,
                         "Invalid hex color pattern '" + pattern + "': " + ex.what());
  }
}

ImageLimits image_limits(const GeneratorConfig& config) {
  ImageLimits limits;
  limits.max_side = config.max_image_side;
  limits.jpeg_quality = config.jpeg_quality;
  limits.max_bytes = config.max_file_bytes;
  return limits;
}

}  // namespace

std::string compose_user_prompt(const std::string& brief,
                                const std::string& accent_color,
                                bool include_accent_hint,
                                bool has_avatar,
                                bool has_qr_code) {
  std::ostringstream prompt;
  prompt << utils::trim_view(brief);
  if (include_accent_hint && !accent_color.empty()) {
    prompt << "\n\nPreferred accent color: " << accent_color;
  }
  if (has_avatar) {
    prompt << "\n\nA profile photo was provided; keep the attribute src=\"avatar.png\" in the HTML.";
  }
  if (has_qr_code) {
    prompt << "\n\nA LinkedIn QR code was provided; keep the attribute src=\"qr.png\" in the HTML.";
  }
  return prompt.str();
}

RequestBuilder::RequestBuilder(GeneratorConfig config)
    : config_(std::move(config)),
      color_pattern_(compile_color_pattern(config_.hex_color_pattern)),
      normalizer_(image_limits(config_)),
      encoder_(config_.max_file_bytes) {
  if (config_.min_tokens <= 0 || config_.min_tokens > config_.max_tokens) {
    throw ResumeGenError(ErrorKind::Configuration, "Token bounds must satisfy 0 < min_tokens <= max_tokens");
  }
  if (config_.available_models.empty()) {
    throw ResumeGenError(ErrorKind::Configuration, "At least one model must be available");
  }
}

void RequestBuilder::validate_brief(const std::string& brief) const {
  const std::size_t length = utils::utf8_length(brief);
  if (length > config_.max_brief_length) {
    throw ResumeGenError(ErrorKind::BriefTooLong,
                         "Brief is " + std::to_string(length) + " characters; the limit is " +
                             std::to_string(config_.max_brief_length));
  }
}

void RequestBuilder::validate_accent_color(const std::string& color) const {
  if (!std::regex_match(color, color_pattern_)) {
    throw ResumeGenError(ErrorKind::InvalidColor, "Accent color '" + color + "' is not a #RRGGBB hex color");
  }
}

std::string RequestBuilder::resolve_model(const std::string& model) const {
  const std::string& selected = model.empty() ? config_.default_model : model;
  const auto& models = config_.available_models;
  if (std::find(models.begin(), models.end(), selected) == models.end()) {
    throw ResumeGenError(ErrorKind::UnsupportedModel, "Model '" + selected + "' is not in the allow-list");
  }
  return selected;
}

int RequestBuilder::clamp_tokens(std::optional<int> requested) const {
  return std::clamp(requested.value_or(config_.default_tokens), config_.min_tokens, config_.max_tokens);
}

GenerationRequest RequestBuilder::build(const GenerationInput& input) const {
  validate_brief(input.brief);
  validate_accent_color(input.accent_color);

  GenerationRequest request;
  request.model = resolve_model(input.model);
  request.system_instructions = input.system_instructions;
  request.brief_text = input.brief;
  request.accent_color = input.accent_color;
  request.max_tokens = clamp_tokens(input.max_tokens);
  const double temperature = input.temperature.value_or(config_.default_temperature);
  if (!std::isfinite(temperature)) {
    throw ResumeGenError(ErrorKind::MalformedRequest, "Temperature must be a finite number");
  }
  request.temperature = std::clamp(temperature, kMinTemperature, kMaxTemperature);

  std::vector<const Attachment*> ordered;
  ordered.reserve(input.attachments.size() + 2);
  for (const auto& attachment : input.attachments) {
    ordered.push_back(&attachment);
  }
  if (input.avatar) {
    ordered.push_back(&*input.avatar);
  }
  if (input.qr_code) {
    ordered.push_back(&*input.qr_code);
  }

  request.attachments.reserve(ordered.size());
  for (const Attachment* attachment : ordered) {
    if (attachment->kind == AttachmentKind::Image) {
      request.attachments.push_back(normalizer_.normalize(*attachment));
    } else {
      request.attachments.push_back(*attachment);
    }
  }

  const std::string prompt = compose_user_prompt(input.brief, input.accent_color, input.include_accent_hint,
                                                 input.avatar.has_value(), input.qr_code.has_value());
  request.content = encoder_.encode(request.attachments, prompt);
  return request;
}

}  // namespace resumegen
