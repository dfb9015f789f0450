#pragma once

#include <cstdint>
#include <vector>

namespace osim::color {

// Decoded image: row-major, 3 bytes per pixel in R, G, B order.
// pixels.size() must equal width * height * 3.
struct Image {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> pixels;
};

}  // namespace osim::color
