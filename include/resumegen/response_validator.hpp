#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace resumegen {

/**
 * Structural sanity check for generated documents. Never rewrites content.
 *
 * A response is plausible when, after trimming surrounding whitespace, it is
 * non-empty, starts with `<!DOCTYPE html` or `<html`, and has `</html>`
 * within the last `window` characters. Matching is case-insensitive.
 */
class ResponseValidator {
public:
  static constexpr std::size_t kDefaultWindow = 512;

  explicit ResponseValidator(std::size_t window = kDefaultWindow) : window_(window) {}

  /// Reason the text was rejected, or nullopt when it is plausible HTML.
  std::optional<std::string> check(const std::string& text) const;

  bool is_valid(const std::string& text) const { return !check(text).has_value(); }

  /// Returns `text` unchanged, or throws ResumeGenError(InvalidHTMLResponse).
  const std::string& validate(const std::string& text) const;

private:
  std::size_t window_;
};

/**
 * Substitutes the first `src="avatar.png"` / `src='avatar.png'` and
 * `src="qr.png"` / `src='qr.png'` placeholders with the given data URIs.
 * Runs after validation, on the caller's copy of the document.
 */
std::string apply_image_overrides(std::string html,
                                  const std::optional<std::string>& avatar_uri,
                                  const std::optional<std::string>& qr_uri);

/// Writes the document to `path`, replacing any existing file.
/// Throws ResumeGenError(FileNotFound) when the file cannot be opened or fully written.
void write_document(const std::filesystem::path& path, const std::string& html);

}  // namespace resumegen
