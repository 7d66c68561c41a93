#include <gtest/gtest.h>

#include "resumegen/error.hpp"
#include "resumegen/response_validator.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using resumegen::ErrorKind;
using resumegen::ResponseValidator;
using resumegen::ResumeGenError;

TEST(ResponseValidatorTest, AcceptsDoctypeDocument) {
  ResponseValidator validator;
  const std::string html = "<!DOCTYPE html><html><head></head><body>x</body></html>";
  EXPECT_TRUE(validator.is_valid(html));
  EXPECT_EQ(&validator.validate(html), &html);
}

TEST(ResponseValidatorTest, AcceptsBareHtmlAndSurroundingWhitespace) {
  ResponseValidator validator;
  EXPECT_TRUE(validator.is_valid("<html><body>x</body></html>"));
  EXPECT_TRUE(validator.is_valid("\n\n   <HTML lang=\"en\"><body>x</body></HTML>\n"));
  EXPECT_TRUE(validator.is_valid("<!doctype HTML>\n<html></html>"));
}

TEST(ResponseValidatorTest, RejectsEmptyResponses) {
  ResponseValidator validator;
  EXPECT_FALSE(validator.is_valid(""));
  EXPECT_FALSE(validator.is_valid("   \n\t "));
}

TEST(ResponseValidatorTest, RejectsProseAroundTheDocument) {
  ResponseValidator validator;
  EXPECT_FALSE(validator.is_valid("hello world"));
  EXPECT_FALSE(validator.is_valid("Here is your resume: <div>...</div>"));
  EXPECT_FALSE(validator.is_valid("<html><body>x</body>"));
  EXPECT_FALSE(validator.is_valid("Here is your resume:\n```html\n<!DOCTYPE html><html><body>x</body></html>\n```"));
  EXPECT_FALSE(validator.is_valid("```html\n<!DOCTYPE html><html><body>x</body></html>\n```"));
  EXPECT_FALSE(validator.is_valid("<body><html></html>"));
}

TEST(ResponseValidatorTest, ClosingTagMustBeInTailWindow) {
  ResponseValidator validator(16);
  const std::string padding(64, 'x');
  EXPECT_FALSE(validator.is_valid(padding + "<html>body</html>"));
  EXPECT_FALSE(validator.is_valid("<html>" + padding + "</html>" + padding));
  EXPECT_TRUE(validator.is_valid("<html>" + padding + "</html>"));
}

TEST(ResponseValidatorTest, ValidateThrowsWithReason) {
  ResponseValidator validator;
  try {
    validator.validate("Sorry, I cannot help with that.");
    FAIL() << "Expected InvalidHTMLResponse";
  } catch (const ResumeGenError& err) {
    EXPECT_EQ(err.kind(), ErrorKind::InvalidHTMLResponse);
    EXPECT_NE(std::string(err.what()).find("does not start with"), std::string::npos);
  }
}

TEST(ApplyImageOverridesTest, ReplacesPlaceholders) {
  const std::string html =
      "<html><img src=\"avatar.png\"><img src='qr.png'><img src=\"avatar.png\"></html>";
  auto result = resumegen::apply_image_overrides(html, std::string("data:image/png;base64,AAA"),
                                                 std::string("data:image/png;base64,BBB"));
  EXPECT_EQ(result,
            "<html><img src=\"data:image/png;base64,AAA\"><img src='data:image/png;base64,BBB'>"
            "<img src=\"avatar.png\"></html>");
}

TEST(ApplyImageOverridesTest, LeavesDocumentAloneWithoutImages) {
  const std::string html = "<html><img src=\"avatar.png\"></html>";
  EXPECT_EQ(resumegen::apply_image_overrides(html, std::nullopt, std::nullopt), html);
  EXPECT_EQ(resumegen::apply_image_overrides("<html></html>", std::string("data:x"), std::nullopt), "<html></html>");
}

TEST(WriteDocumentTest, WritesExactBytes) {
  const auto path = std::filesystem::temp_directory_path() / "resumegen_write_document_test.html";
  const std::string html = "<!DOCTYPE html><html><body>caf\xC3\xA9</body></html>\n";
  resumegen::write_document(path, html);

  std::ifstream in(path, std::ios::binary);
  std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  EXPECT_EQ(written, html);
  in.close();
  std::filesystem::remove(path);
}

TEST(WriteDocumentTest, UnwritablePathIsReported) {
  const auto path = std::filesystem::temp_directory_path() / "resumegen_missing_dir" / "nested" / "out.html";
  try {
    resumegen::write_document(path, "<html></html>");
    FAIL() << "Expected FileNotFound";
  } catch (const ResumeGenError& err) {
    EXPECT_EQ(err.kind(), ErrorKind::FileNotFound);
    EXPECT_NE(std::string(err.what()).find("out.html"), std::string::npos);
  }
}

#if defined(__linux__)
TEST(WriteDocumentTest, FailedWriteIsReported) {
  if (!std::filesystem::exists("/dev/full")) {
    GTEST_SKIP() << "/dev/full not available";
  }
  try {
    resumegen::write_document("/dev/full", std::string(1 << 16, 'x'));
    FAIL() << "Expected FileNotFound";
  } catch (const ResumeGenError& err) {
    EXPECT_EQ(err.kind(), ErrorKind::FileNotFound);
    EXPECT_NE(std::string(err.what()).find("Failed writing"), std::string::npos);
  }
}
#endif
