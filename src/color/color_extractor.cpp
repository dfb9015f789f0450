#include "osim/color/color_extractor.h"

#include <opencv2/core.hpp>

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>

namespace osim::color {

namespace {

using Result = core::Result<std::vector<DominantColor>, core::ImageDecodeError>;

Result fail(core::ImageErrorCode code, std::string detail) {
  return Result::err(core::ImageDecodeError{code, std::move(detail)});
}

// One row per pixel, RGB as float columns, the layout cv::kmeans expects.
cv::Mat to_samples(const Image& image, int pixel_count) {
  cv::Mat samples(pixel_count, 3, CV_32F);
  for (int i = 0; i < pixel_count; ++i) {
    const auto base = static_cast<std::size_t>(i) * 3U;
    auto* row = samples.ptr<float>(i);
    row[0] = static_cast<float>(image.pixels[base]);
    row[1] = static_cast<float>(image.pixels[base + 1]);
    row[2] = static_cast<float>(image.pixels[base + 2]);
  }
  return samples;
}

std::uint8_t truncate_channel(double value) {
  return static_cast<std::uint8_t>(std::clamp(static_cast<int>(value), 0, 255));
}

}  // namespace

Result extract_dominant_colors(const Image& image, const ExtractionOptions& options) {
  if (image.width <= 0 || image.height <= 0) {
    return fail(core::ImageErrorCode::kEmptyImage, "image has no pixels");
  }
  const auto expected = static_cast<std::size_t>(image.width) *
                        static_cast<std::size_t>(image.height) * 3U;
  if (image.pixels.size() != expected) {
    return fail(core::ImageErrorCode::kMalformedBuffer,
                "expected " + std::to_string(expected) + " bytes, got " +
                    std::to_string(image.pixels.size()));
  }
  if (options.k < 1 || options.attempts < 1 || options.max_iterations < 1) {
    return fail(core::ImageErrorCode::kInvalidClusterCount,
                "k, attempts and max_iterations must be positive");
  }

  const int pixel_count = image.width * image.height;
  // cv::kmeans needs at least as many samples as clusters.
  const int clusters = std::min(options.k, pixel_count);

  cv::Mat samples = to_samples(image, pixel_count);
  cv::Mat labels;
  cv::Mat centers;
  cv::setRNGSeed(static_cast<int>(options.seed));
  cv::kmeans(samples, clusters, labels,
             cv::TermCriteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT,
                              options.max_iterations, options.tolerance),
             options.attempts, cv::KMEANS_PP_CENTERS, centers);

  // Centroids are recomputed in double from the final labels so that
  // truncation does not see float rounding of the cluster means.
  const auto k = static_cast<std::size_t>(clusters);
  std::vector<std::array<double, 3>> sums(k, std::array<double, 3>{0.0, 0.0, 0.0});
  std::vector<double> pixel_counts(k, 0.0);
  for (int i = 0; i < pixel_count; ++i) {
    const auto label = static_cast<std::size_t>(labels.at<int>(i));
    const auto base = static_cast<std::size_t>(i) * 3U;
    for (std::size_t ch = 0; ch < 3; ++ch) {
      sums[label][ch] += image.pixels[base + ch];
    }
    pixel_counts[label] += 1.0;
  }

  // Merge clusters whose integer centroids coincide, in cluster order.
  std::vector<DominantColor> colors;
  const double total_pixels = static_cast<double>(pixel_count);
  for (std::size_t c = 0; c < k; ++c) {
    if (pixel_counts[c] == 0.0) {
      continue;
    }
    const Color centroid{truncate_channel(sums[c][0] / pixel_counts[c]),
                         truncate_channel(sums[c][1] / pixel_counts[c]),
                         truncate_channel(sums[c][2] / pixel_counts[c])};
    const double share = pixel_counts[c] / total_pixels * 100.0;
    auto existing = std::find_if(colors.begin(), colors.end(),
                                 [&](const DominantColor& d) { return d.color == centroid; });
    if (existing != colors.end()) {
      existing->percentage += share;
    } else {
      colors.push_back(DominantColor{centroid, share});
    }
  }

  std::stable_sort(colors.begin(), colors.end(),
                   [](const DominantColor& a, const DominantColor& b) {
                     return a.percentage > b.percentage;
                   });
  return Result::ok(std::move(colors));
}

}  // namespace osim::color
