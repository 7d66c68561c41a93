#include <gtest/gtest.h>

#include "resumegen/config.hpp"
#include "resumegen/error.hpp"
#include "resumegen/request_builder.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include <limits>
#include <string>
#include <variant>
#include <vector>

using resumegen::Attachment;
using resumegen::ErrorKind;
using resumegen::GenerationInput;
using resumegen::GeneratorConfig;
using resumegen::InlineFileBlock;
using resumegen::InlineImageBlock;
using resumegen::RequestBuilder;
using resumegen::ResumeGenError;
using resumegen::TextBlock;

namespace {

GenerationInput base_input() {
  GenerationInput input;
  input.system_instructions = "Return a single HTML document.";
  input.brief = "Grace Hopper. Rear admiral, compiler pioneer.";
  input.accent_color = "#336699";
  return input;
}

Attachment small_png(const std::string& filename) {
  cv::Mat image(32, 48, CV_8UC3, cv::Scalar(40, 90, 200));
  std::vector<std::uint8_t> bytes;
  cv::imencode(".png", image, bytes);
  return resumegen::make_attachment(std::move(bytes), "image/png", filename);
}

Attachment small_pdf(const std::string& filename) {
  const std::string body = "%PDF-1.4\n%%EOF\n";
  return resumegen::make_attachment(std::vector<std::uint8_t>(body.begin(), body.end()), "application/pdf", filename);
}

ErrorKind build_error(const RequestBuilder& builder, const GenerationInput& input) {
  try {
    builder.build(input);
  } catch (const ResumeGenError& err) {
    return err.kind();
  }
  ADD_FAILURE() << "Expected build to fail";
  return ErrorKind::RemoteError;
}

}  // namespace

TEST(RequestBuilderTest, BuildsMinimalRequest) {
  RequestBuilder builder{GeneratorConfig{}};
  auto request = builder.build(base_input());

  EXPECT_EQ(request.model, "gpt-4.1-mini");
  EXPECT_EQ(request.max_tokens, 6000);
  EXPECT_DOUBLE_EQ(request.temperature, 0.2);
  EXPECT_EQ(request.system_instructions, "Return a single HTML document.");
  EXPECT_EQ(request.accent_color, "#336699");
  EXPECT_TRUE(request.attachments.empty());

  ASSERT_EQ(request.content.size(), 1u);
  const auto* text = std::get_if<TextBlock>(&request.content[0]);
  ASSERT_NE(text, nullptr);
  EXPECT_EQ(text->text, "Grace Hopper. Rear admiral, compiler pioneer.\n\nPreferred accent color: #336699");
}

TEST(RequestBuilderTest, AcceptsUpperAndLowerCaseHex) {
  RequestBuilder builder{GeneratorConfig{}};
  EXPECT_NO_THROW(builder.validate_accent_color("#12AB9f"));
  EXPECT_NO_THROW(builder.validate_accent_color("#000000"));
}

TEST(RequestBuilderTest, RejectsMalformedColors) {
  RequestBuilder builder{GeneratorConfig{}};
  for (const std::string color : {"#12345", "red", "#GGGGGG", "123456", "#1234567", "", " #123456"}) {
    auto input = base_input();
    input.accent_color = color;
    EXPECT_EQ(build_error(builder, input), ErrorKind::InvalidColor) << "color '" << color << "'";
  }
}

TEST(RequestBuilderTest, RejectsBriefOverLimit) {
  GeneratorConfig config;
  config.max_brief_length = 20;
  RequestBuilder builder{config};

  auto input = base_input();
  input.brief = std::string(21, 'x');
  EXPECT_EQ(build_error(builder, input), ErrorKind::BriefTooLong);

  input.brief = std::string(20, 'x');
  EXPECT_NO_THROW(builder.build(input));
}

TEST(RequestBuilderTest, CountsBriefLengthInCharacters) {
  GeneratorConfig config;
  config.max_brief_length = 5;
  RequestBuilder builder{config};

  // Five two-byte characters.
  EXPECT_NO_THROW(builder.validate_brief("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9"));
  EXPECT_THROW(builder.validate_brief("\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9!"), ResumeGenError);
}

TEST(RequestBuilderTest, ChecksBriefBeforeColorAndModel) {
  GeneratorConfig config;
  config.max_brief_length = 3;
  RequestBuilder builder{config};

  auto input = base_input();
  input.brief = "too long";
  input.accent_color = "red";
  input.model = "unknown-model";
  EXPECT_EQ(build_error(builder, input), ErrorKind::BriefTooLong);

  input.brief = "ok";
  EXPECT_EQ(build_error(builder, input), ErrorKind::InvalidColor);

  input.accent_color = "#336699";
  EXPECT_EQ(build_error(builder, input), ErrorKind::UnsupportedModel);
}

TEST(RequestBuilderTest, ResolvesModelsAgainstAllowList) {
  RequestBuilder builder{GeneratorConfig{}};
  EXPECT_EQ(builder.resolve_model(""), "gpt-4.1-mini");
  EXPECT_EQ(builder.resolve_model("gpt-4o"), "gpt-4o");
  EXPECT_THROW(builder.resolve_model("gpt-2"), ResumeGenError);
}

TEST(RequestBuilderTest, ClampsTokenBudget) {
  RequestBuilder builder{GeneratorConfig{}};
  EXPECT_EQ(builder.clamp_tokens(std::nullopt), 6000);
  EXPECT_EQ(builder.clamp_tokens(10), 1024);
  EXPECT_EQ(builder.clamp_tokens(20000), 8000);
  EXPECT_EQ(builder.clamp_tokens(4096), 4096);
}

TEST(RequestBuilderTest, ClampsTemperature) {
  RequestBuilder builder{GeneratorConfig{}};
  auto input = base_input();
  input.temperature = 3.5;
  EXPECT_DOUBLE_EQ(builder.build(input).temperature, 2.0);
  input.temperature = -1.0;
  EXPECT_DOUBLE_EQ(builder.build(input).temperature, 0.0);
}

TEST(RequestBuilderTest, RejectsNonFiniteTemperature) {
  RequestBuilder builder{GeneratorConfig{}};
  auto input = base_input();
  for (double value : {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity(),
                       -std::numeric_limits<double>::infinity()}) {
    input.temperature = value;
    EXPECT_EQ(build_error(builder, input), ErrorKind::MalformedRequest) << value;
  }

  GeneratorConfig config;
  config.default_temperature = std::numeric_limits<double>::quiet_NaN();
  RequestBuilder misconfigured{config};
  input.temperature.reset();
  EXPECT_EQ(build_error(misconfigured, input), ErrorKind::MalformedRequest);
}

TEST(RequestBuilderTest, OrdersAttachmentsBeforeText) {
  RequestBuilder builder{GeneratorConfig{}};
  auto input = base_input();
  input.attachments.push_back(small_pdf("linkedin.pdf"));
  input.attachments.push_back(small_png("portfolio.png"));
  input.avatar = small_png("me.png");
  input.qr_code = small_png("qr.png");

  auto request = builder.build(input);
  ASSERT_EQ(request.attachments.size(), 4u);
  EXPECT_EQ(request.attachments[0].filename, "linkedin.pdf");
  EXPECT_EQ(request.attachments[1].filename, "portfolio.png");
  EXPECT_EQ(request.attachments[2].filename, "me.png");
  EXPECT_EQ(request.attachments[3].filename, "qr.png");

  ASSERT_EQ(request.content.size(), 5u);
  const auto* file = std::get_if<InlineFileBlock>(&request.content[0]);
  ASSERT_NE(file, nullptr);
  EXPECT_EQ(file->filename, "linkedin.pdf");
  EXPECT_EQ(file->data_uri.rfind("data:application/pdf;base64,", 0), 0u);
  EXPECT_TRUE(std::holds_alternative<InlineImageBlock>(request.content[1]));
  EXPECT_TRUE(std::holds_alternative<InlineImageBlock>(request.content[2]));
  EXPECT_TRUE(std::holds_alternative<InlineImageBlock>(request.content[3]));

  const auto* text = std::get_if<TextBlock>(&request.content[4]);
  ASSERT_NE(text, nullptr);
  EXPECT_NE(text->text.find("src=\"avatar.png\""), std::string::npos);
  EXPECT_NE(text->text.find("src=\"qr.png\""), std::string::npos);

  std::size_t text_blocks = 0;
  for (const auto& block : request.content) {
    if (std::holds_alternative<TextBlock>(block)) {
      ++text_blocks;
    }
  }
  EXPECT_EQ(text_blocks, 1u);
}

TEST(RequestBuilderTest, RejectsUnsupportedAttachment) {
  RequestBuilder builder{GeneratorConfig{}};
  auto input = base_input();
  const std::string body = "GIF89a";
  input.attachments.push_back(
      resumegen::make_attachment(std::vector<std::uint8_t>(body.begin(), body.end()), "image/gif", "anim.gif"));
  EXPECT_EQ(build_error(builder, input), ErrorKind::UnsupportedFormat);
}

TEST(RequestBuilderTest, RejectsOversizedDocument) {
  GeneratorConfig config;
  config.max_file_bytes = 8;
  RequestBuilder builder{config};
  auto input = base_input();
  input.attachments.push_back(small_pdf("big.pdf"));
  EXPECT_EQ(build_error(builder, input), ErrorKind::PayloadTooLarge);
}

TEST(RequestBuilderTest, RejectsInvalidConfiguration) {
  GeneratorConfig bad_pattern;
  bad_pattern.hex_color_pattern = "^#[0-9";
  EXPECT_THROW(RequestBuilder{bad_pattern}, ResumeGenError);

  GeneratorConfig bad_tokens;
  bad_tokens.min_tokens = 9000;
  EXPECT_THROW(RequestBuilder{bad_tokens}, ResumeGenError);

  GeneratorConfig no_models;
  no_models.available_models.clear();
  EXPECT_THROW(RequestBuilder{no_models}, ResumeGenError);
}

TEST(ComposeUserPromptTest, OmitsAccentHintWhenDisabled) {
  EXPECT_EQ(resumegen::compose_user_prompt("  Brief  ", "#336699", false, false, false), "Brief");
  EXPECT_EQ(resumegen::compose_user_prompt("Brief", "#336699", true, false, false),
            "Brief\n\nPreferred accent color: #336699");
}
