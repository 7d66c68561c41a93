#include "resumegen/image_normalizer.hpp"

#include "resumegen/error.hpp"
#include "resumegen/utils/values.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace resumegen {
namespace {

const std::set<std::string> kSupportedImageTypes = {"image/png", "image/jpeg", "image/jpg", "image/webp"};

cv::Mat decode_image(const Attachment& image) {
  if (image.bytes.empty()) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat, "Image '" + image.filename + "' is empty");
  }
  cv::Mat raw(1, static_cast<int>(image.bytes.size()), CV_8UC1, const_cast<std::uint8_t*>(image.bytes.data()));
  cv::Mat decoded;
  try {
    decoded = cv::imdecode(raw, cv::IMREAD_COLOR);
  } catch (const cv::Exception& ex) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat,
                         "Could not decode image '" + image.filename + "': " + ex.what());
  }
  if (decoded.empty()) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat,
                         "Could not decode image '" + image.filename + "' as " + image.mime_type);
  }
  return decoded;
}

std::string jpeg_filename(const std::string& filename) {
  if (filename.empty()) {
    return filename;
  }
  return std::filesystem::path(filename).replace_extension(".jpg").string();
}

}  // namespace

ImageNormalizer::ImageNormalizer(ImageLimits limits) : limits_(limits) {
  if (limits_.max_side <= 0) {
    throw ResumeGenError(ErrorKind::Configuration, "ImageLimits.max_side must be positive");
  }
  if (limits_.jpeg_quality < 1 || limits_.jpeg_quality > 100) {
    throw ResumeGenError(ErrorKind::Configuration, "ImageLimits.jpeg_quality must be within [1, 100]");
  }
}

Attachment ImageNormalizer::normalize(const Attachment& image) const {
  if (kSupportedImageTypes.count(utils::to_lower(image.mime_type)) == 0) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat,
                         "Unsupported image format '" + image.mime_type + "' for '" + image.filename + "'");
  }

  cv::Mat decoded = decode_image(image);
  const int width = decoded.cols;
  const int height = decoded.rows;
  const int longest = std::max(width, height);

  if (longest <= limits_.max_side && image.size_bytes() <= limits_.max_bytes) {
    return image;
  }

  cv::Mat scaled = decoded;
  if (longest > limits_.max_side) {
    const double scale = static_cast<double>(limits_.max_side) / static_cast<double>(longest);
    const int new_width = std::max(1, static_cast<int>(std::lround(width * scale)));
    const int new_height = std::max(1, static_cast<int>(std::lround(height * scale)));
    cv::resize(decoded, scaled, cv::Size(new_width, new_height), 0, 0, cv::INTER_AREA);
  }

  std::vector<std::uint8_t> encoded;
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, limits_.jpeg_quality, cv::IMWRITE_JPEG_OPTIMIZE, 1};
  bool ok = false;
  try {
    ok = cv::imencode(".jpg", scaled, encoded, params);
  } catch (const cv::Exception& ex) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat,
                         "Could not re-encode image '" + image.filename + "': " + ex.what());
  }
  if (!ok) {
    throw ResumeGenError(ErrorKind::UnsupportedFormat, "Could not re-encode image '" + image.filename + "'");
  }

  if (encoded.size() > limits_.max_bytes) {
    throw ResumeGenError(ErrorKind::PayloadTooLarge,
                         "Image '" + image.filename + "' is " + std::to_string(encoded.size()) +
                             " bytes after re-encoding at " + std::to_string(scaled.cols) + "x" +
                             std::to_string(scaled.rows) + ", above the " + std::to_string(limits_.max_bytes) +
                             " byte limit");
  }

  return make_attachment(std::move(encoded), "image/jpeg", jpeg_filename(image.filename));
}

}  // namespace resumegen
