#pragma once

#include "osim/color/color.h"
#include "osim/color/image.h"
#include "osim/core/errors.h"
#include "osim/core/result.h"

#include <cstdint>
#include <vector>

namespace osim::color {

struct ExtractionOptions {
  int k{3};
  int attempts{10};         // independent k-means++ initializations
  int max_iterations{300};  // iteration cap per attempt
  double tolerance{1e-4};   // converged when no centroid moves further than this
  std::uint32_t seed{42};   // reseeds OpenCV's thread-local RNG on every call
};

struct DominantColor {
  Color color;
  double percentage{0.0};  // share of pixels, (0, 100]
};

// Clusters the image pixels in RGB space with cv::kmeans (k-means++ seeding,
// best of `attempts` runs) and returns one entry per non-empty cluster,
// sorted by percentage descending (ties keep cluster order).
//
// Centroids are truncated to integers; clusters whose truncated centroids
// coincide are merged and their percentages summed, so fewer than k entries
// may be returned. An image with fewer distinct colors than k therefore
// yields one entry per distinct color. k is capped at the pixel count.
//
// Deterministic for a given image and options. Errors:
//   kEmptyImage            width or height is zero or negative
//   kMalformedBuffer       pixels.size() != width * height * 3
//   kInvalidClusterCount   k < 1 or attempts < 1 or max_iterations < 1
[[nodiscard]] core::Result<std::vector<DominantColor>, core::ImageDecodeError>
extract_dominant_colors(const Image& image, const ExtractionOptions& options = {});

}  // namespace osim::color
