#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace osim::core {

enum class ImageErrorCode {
  kUnreadable,            // file missing, unsupported or corrupt
  kEmptyImage,            // zero width or height
  kMalformedBuffer,       // pixel buffer size does not match width * height * 3
  kInvalidClusterCount,   // k < 1
};

// ImageDecodeError is returned (never thrown) by the image loader and the extractor.
struct ImageDecodeError {
  ImageErrorCode code{ImageErrorCode::kUnreadable};
  std::string detail;
};

[[nodiscard]] inline std::string_view image_error_code_to_string(ImageErrorCode code) {
  switch (code) {
    case ImageErrorCode::kUnreadable:
      return "unreadable";
    case ImageErrorCode::kEmptyImage:
      return "empty_image";
    case ImageErrorCode::kMalformedBuffer:
      return "malformed_buffer";
    case ImageErrorCode::kInvalidClusterCount:
      return "invalid_cluster_count";
  }
  return "unknown";
}

// InvalidClassIndex signals a lookup outside a fixed taxonomy (color palette,
// garment classes). It indicates a programming error and is thrown.
class InvalidClassIndex : public std::out_of_range {
 public:
  InvalidClassIndex(std::string_view taxonomy, std::size_t index, std::size_t size)
      : std::out_of_range("invalid " + std::string(taxonomy) + " index " +
                          std::to_string(index) + " (expected 0-" +
                          std::to_string(size == 0 ? 0 : size - 1) + ")"),
        index_(index) {}

  [[nodiscard]] std::size_t index() const noexcept { return index_; }

 private:
  std::size_t index_;
};

}  // namespace osim::core
