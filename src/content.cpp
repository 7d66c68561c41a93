#include "resumegen/content.hpp"

#include "resumegen/error.hpp"
#include "resumegen/utils/base64.hpp"
#include "resumegen/utils/values.hpp"

#include <fstream>
#include <iterator>
#include <map>

namespace resumegen {

std::string guess_mime_type(const std::filesystem::path& path) {
  static const std::map<std::string, std::string> kExtensionTypes = {
      {".png", "image/png"},
      {".jpg", "image/jpeg"},
      {".jpeg", "image/jpeg"},
      {".webp", "image/webp"},
      {".pdf", "application/pdf"},
  };
  auto it = kExtensionTypes.find(utils::to_lower(path.extension().string()));
  if (it == kExtensionTypes.end()) {
    return "application/octet-stream";
  }
  return it->second;
}

bool is_image_mime(std::string_view mime_type) {
  return utils::to_lower(mime_type).rfind("image/", 0) == 0;
}

Attachment make_attachment(std::vector<std::uint8_t> bytes, std::string mime_type, std::string filename) {
  Attachment attachment;
  attachment.kind = is_image_mime(mime_type) ? AttachmentKind::Image : AttachmentKind::Document;
  attachment.bytes = std::move(bytes);
  attachment.mime_type = std::move(mime_type);
  attachment.filename = std::move(filename);
  return attachment;
}

Attachment load_attachment(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw ResumeGenError(ErrorKind::FileNotFound, "File does not exist: " + path.string());
  }
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    throw ResumeGenError(ErrorKind::FileNotFound, "Could not open file: " + path.string());
  }
  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (input.bad()) {
    throw ResumeGenError(ErrorKind::FileNotFound, "Could not read file: " + path.string());
  }
  return make_attachment(std::move(bytes), guess_mime_type(path), path.filename().string());
}

std::optional<std::string> to_data_uri(const Attachment& attachment) {
  if (attachment.kind != AttachmentKind::Image || attachment.bytes.empty()) {
    return std::nullopt;
  }
  return utils::make_data_uri(attachment.mime_type, attachment.bytes);
}

}  // namespace resumegen
