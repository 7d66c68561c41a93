#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "resumegen/config.hpp"
#include "resumegen/content.hpp"
#include "resumegen/image_normalizer.hpp"
#include "resumegen/payload_encoder.hpp"

namespace resumegen {

/// Raw user submission, as collected by the presentation layer.
struct GenerationInput {
  std::string system_instructions;
  std::string brief;
  std::string accent_color;
  /// Empty selects GeneratorConfig::default_model.
  std::string model;
  std::optional<int> max_tokens;
  std::optional<double> temperature;
  /// Context files, in upload order.
  std::vector<Attachment> attachments;
  std::optional<Attachment> avatar;
  std::optional<Attachment> qr_code;
  bool include_accent_hint = true;
};

/// Validated request, ready for dispatch.
struct GenerationRequest {
  std::string system_instructions;
  std::string brief_text;
  std::string accent_color;
  std::string model;
  int max_tokens = 0;
  double temperature = 0.0;
  /// Normalized attachments: context files first, then avatar, then QR code.
  std::vector<Attachment> attachments;
  /// Encoded user message: one block per attachment, then the prompt text.
  std::vector<ContentBlock> content;
};

/**
 * Prompt text sent after the attachments: the trimmed brief, then the
 * optional accent-color hint and placeholder notes for avatar and QR images,
 * separated by blank lines.
 */
std::string compose_user_prompt(const std::string& brief,
                                const std::string& accent_color,
                                bool include_accent_hint,
                                bool has_avatar,
                                bool has_qr_code);

class RequestBuilder {
public:
  explicit RequestBuilder(GeneratorConfig config);

  const GeneratorConfig& config() const { return config_; }

  /**
   * Validates and assembles a request. Throws ResumeGenError with
   * BriefTooLong, InvalidColor or UnsupportedModel (checked in that order),
   * MalformedRequest for a NaN or infinite temperature, then
   * UnsupportedFormat or PayloadTooLarge for attachments.
   * `max_tokens` is clamped into [min_tokens, max_tokens] and temperature
   * into [0, 2].
   */
  GenerationRequest build(const GenerationInput& input) const;

  void validate_brief(const std::string& brief) const;
  void validate_accent_color(const std::string& color) const;
  std::string resolve_model(const std::string& model) const;
  int clamp_tokens(std::optional<int> requested) const;

private:
  GeneratorConfig config_;
  std::regex color_pattern_;
  ImageNormalizer normalizer_;
  PayloadEncoder encoder_;
};

}  // namespace resumegen
