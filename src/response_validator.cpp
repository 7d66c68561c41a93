#include "resumegen/response_validator.hpp"

#include "resumegen/error.hpp"
#include "resumegen/utils/values.hpp"

#include <fstream>
#include <string_view>

namespace resumegen {
namespace {

constexpr std::string_view kDoctype = "<!doctype html";
constexpr std::string_view kHtmlOpen = "<html";

bool starts_with(std::string_view text, std::string_view prefix) {
  return text.substr(0, prefix.size()) == prefix;
}

void replace_first(std::string& text, const std::string& needle, const std::string& replacement) {
  auto pos = text.find(needle);
  if (pos != std::string::npos) {
    text.replace(pos, needle.size(), replacement);
  }
}

void substitute_placeholder(std::string& html, const std::string& placeholder, const std::string& uri) {
  replace_first(html, "src=\"" + placeholder + "\"", "src=\"" + uri + "\"");
  replace_first(html, "src='" + placeholder + "'", "src='" + uri + "'");
}

}  // namespace

std::optional<std::string> ResponseValidator::check(const std::string& text) const {
  std::string_view trimmed = utils::trim_view(text);
  if (trimmed.empty()) {
    return std::string("response is empty");
  }

  const std::string head = utils::to_lower(trimmed.substr(0, kDoctype.size()));
  if (!starts_with(head, kDoctype) && !starts_with(head, kHtmlOpen)) {
    return std::string("document does not start with <!DOCTYPE html> or <html>");
  }

  const std::size_t tail_start = trimmed.size() > window_ ? trimmed.size() - window_ : 0;
  const std::string tail = utils::to_lower(trimmed.substr(tail_start));
  if (tail.find("</html>") == std::string::npos) {
    return "no closing </html> tag in the last " + std::to_string(window_) + " characters";
  }
  return std::nullopt;
}

const std::string& ResponseValidator::validate(const std::string& text) const {
  if (auto reason = check(text)) {
    throw ResumeGenError(ErrorKind::InvalidHTMLResponse, "Model output is not an HTML document: " + *reason);
  }
  return text;
}

std::string apply_image_overrides(std::string html,
                                  const std::optional<std::string>& avatar_uri,
                                  const std::optional<std::string>& qr_uri) {
  if (avatar_uri) {
    substitute_placeholder(html, "avatar.png", *avatar_uri);
  }
  if (qr_uri) {
    substitute_placeholder(html, "qr.png", *qr_uri);
  }
  return html;
}

void write_document(const std::filesystem::path& path, const std::string& html) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw ResumeGenError(ErrorKind::FileNotFound, "Could not open " + path.string() + " for writing");
  }
  out.write(html.data(), static_cast<std::streamsize>(html.size()));
  out.close();
  if (!out) {
    throw ResumeGenError(ErrorKind::FileNotFound, "Failed writing " + path.string());
  }
}

}  // namespace resumegen
