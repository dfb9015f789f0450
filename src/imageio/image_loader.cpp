#include "osim/imageio/image_loader.h"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <utility>

namespace osim::imageio {

namespace {

LoadResult unreadable(std::string detail) {
  return LoadResult::err(
      core::ImageDecodeError{core::ImageErrorCode::kUnreadable, std::move(detail)});
}

// OpenCV decodes to BGR; the core works on RGB.
LoadResult to_rgb_image(const cv::Mat& bgr) {
  if (bgr.empty() || bgr.cols <= 0 || bgr.rows <= 0) {
    return LoadResult::err(
        core::ImageDecodeError{core::ImageErrorCode::kEmptyImage, "decoded image is empty"});
  }

  cv::Mat rgb;
  cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
  if (!rgb.isContinuous()) {
    rgb = rgb.clone();
  }

  color::Image image;
  image.width = rgb.cols;
  image.height = rgb.rows;
  const auto* begin = rgb.ptr<std::uint8_t>(0);
  image.pixels.assign(begin, begin + rgb.total() * rgb.elemSize());
  return LoadResult::ok(std::move(image));
}

}  // namespace

LoadResult load_image(const std::string& path) {
  cv::Mat bgr;
  try {
    bgr = cv::imread(path, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    return unreadable("cannot read image '" + path + "': " + e.what());
  }
  if (bgr.empty()) {
    return unreadable("cannot read image '" + path + "'");
  }
  return to_rgb_image(bgr);
}

LoadResult decode_image(const std::vector<std::uint8_t>& encoded) {
  if (encoded.empty()) {
    return unreadable("encoded image buffer is empty");
  }
  cv::Mat bgr;
  try {
    bgr = cv::imdecode(encoded, cv::IMREAD_COLOR);
  } catch (const cv::Exception& e) {
    return unreadable(std::string("cannot decode image: ") + e.what());
  }
  if (bgr.empty()) {
    return unreadable("cannot decode image");
  }
  return to_rgb_image(bgr);
}

}  // namespace osim::imageio
