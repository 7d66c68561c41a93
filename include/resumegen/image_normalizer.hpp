#pragma once

#include <cstddef>

#include "resumegen/content.hpp"

namespace resumegen {

struct ImageLimits {
  int max_side = 2048;
  int jpeg_quality = 85;
  std::size_t max_bytes = 8'000'000;
};

/**
 * Downscales and re-encodes images that exceed the configured limits.
 *
 * Accepted inputs are PNG, JPEG and WebP. An image whose longest side and
 * byte size are already within limits is returned unchanged. Otherwise it
 * is scaled proportionally so that its longest side equals `max_side`
 * (area resampling) and re-encoded as JPEG at `jpeg_quality`.
 *
 * Throws ResumeGenError with UnsupportedFormat for other or undecodable
 * inputs, and PayloadTooLarge when the re-encoded image still exceeds
 * `max_bytes`. Holds no mutable state; safe to share between threads.
 */
class ImageNormalizer {
public:
  explicit ImageNormalizer(ImageLimits limits = {});

  const ImageLimits& limits() const { return limits_; }

  Attachment normalize(const Attachment& image) const;

private:
  ImageLimits limits_;
};

}  // namespace resumegen
