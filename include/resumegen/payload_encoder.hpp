#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "resumegen/content.hpp"

namespace resumegen {

/**
 * Converts attachments and the prompt text into wire content blocks.
 *
 * Output order is the attachments in their given order followed by a single
 * text block (omitted when the text is empty). Every attachment is checked
 * before any is encoded: one above `max_file_bytes` raises PayloadTooLarge,
 * a MIME type other than PNG/JPEG/WebP images or PDF documents raises
 * UnsupportedFormat.
 */
class PayloadEncoder {
public:
  explicit PayloadEncoder(std::size_t max_file_bytes);

  std::size_t max_file_bytes() const { return max_file_bytes_; }

  std::vector<ContentBlock> encode(const std::vector<Attachment>& attachments, const std::string& text) const;

private:
  void check(const Attachment& attachment, std::size_t index) const;
  ContentBlock encode_attachment(const Attachment& attachment, std::size_t index) const;

  std::size_t max_file_bytes_;
};

}  // namespace resumegen
