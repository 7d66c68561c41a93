#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace resumegen {

enum class AttachmentKind { Image, Document };

/**
 * A user-supplied file. Attachments are never modified after creation;
 * transforms such as image normalization produce a new Attachment.
 */
struct Attachment {
  AttachmentKind kind = AttachmentKind::Document;
  std::vector<std::uint8_t> bytes;
  std::string mime_type;
  std::string filename;

  std::size_t size_bytes() const { return bytes.size(); }
};

struct TextBlock {
  std::string text;
};

struct InlineImageBlock {
  std::string mime_type;
  std::string data_uri;
};

struct InlineFileBlock {
  std::string mime_type;
  std::string filename;
  std::string data_uri;
};

/// Wire-level unit of the user message.
using ContentBlock = std::variant<TextBlock, InlineImageBlock, InlineFileBlock>;

/// MIME type from a file extension; `application/octet-stream` when unknown.
std::string guess_mime_type(const std::filesystem::path& path);

bool is_image_mime(std::string_view mime_type);

/// Builds an Attachment, classifying it as an image when the MIME type is `image/*`.
Attachment make_attachment(std::vector<std::uint8_t> bytes, std::string mime_type, std::string filename = {});

/// Reads a file from disk. Throws ResumeGenError(FileNotFound) when it does not exist.
Attachment load_attachment(const std::filesystem::path& path);

/// `data:` URI for an image attachment; nullopt for documents or empty images.
std::optional<std::string> to_data_uri(const Attachment& attachment);

}  // namespace resumegen
