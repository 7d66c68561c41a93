#include "resumegen/payload_encoder.hpp"

#include "resumegen/error.hpp"
#include "resumegen/utils/base64.hpp"
#include "resumegen/utils/values.hpp"

#include <set>

namespace resumegen {
namespace {

const std::set<std::string> kInlineImageTypes = {"image/png", "image/jpeg", "image/jpg", "image/webp"};
const std::set<std::string> kInlineFileTypes = {"application/pdf"};

std::string display_name(const Attachment& attachment, std::size_t index) {
  if (!attachment.filename.empty()) {
    return attachment.filename;
  }
  return "attachment #" + std::to_string(index + 1);
}

}  // namespace

PayloadEncoder::PayloadEncoder(std::size_t max_file_bytes) : max_file_bytes_(max_file_bytes) {}

void PayloadEncoder::check(const Attachment& attachment, std::size_t index) const {
  if (attachment.size_bytes() > max_file_bytes_) {
    throw ResumeGenError(ErrorKind::PayloadTooLarge,
                         display_name(attachment, index) + " is " + std::to_string(attachment.size_bytes()) +
                             " bytes; the limit is " + std::to_string(max_file_bytes_) + " bytes");
  }
  const std::string mime = utils::to_lower(attachment.mime_type);
  const auto& allowed = attachment.kind == AttachmentKind::Image ? kInlineImageTypes : kInlineFileTypes;
  if (allowed.count(mime) == 0) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat,
                         display_name(attachment, index) + " has unsupported type '" + attachment.mime_type + "'");
  }
}

ContentBlock PayloadEncoder::encode_attachment(const Attachment& attachment, std::size_t index) const {
  std::string data_uri = utils::make_data_uri(attachment.mime_type, attachment.bytes);
  if (attachment.kind == AttachmentKind::Image) {
    return InlineImageBlock{attachment.mime_type, std::move(data_uri)};
  }
  std::string filename = attachment.filename;
  if (filename.empty()) {
    filename = "attachment-" + std::to_string(index + 1) + ".pdf";
  }
  return InlineFileBlock{attachment.mime_type, std::move(filename), std::move(data_uri)};
}

std::vector<ContentBlock> PayloadEncoder::encode(const std::vector<Attachment>& attachments,
                                                 const std::string& text) const {
  for (std::size_t i = 0; i < attachments.size(); ++i) {
    check(attachments[i], i);
  }

  std::vector<ContentBlock> blocks;
  blocks.reserve(attachments.size() + 1);
  for (std::size_t i = 0; i < attachments.size(); ++i) {
    blocks.push_back(encode_attachment(attachments[i], i));
  }
  if (!text.empty()) {
    blocks.push_back(TextBlock{text});
  }
  return blocks;
}

}  // namespace resumegen
