#pragma once

#include "osim/color/image.h"
#include "osim/core/errors.h"
#include "osim/core/result.h"

#include <cstdint>
#include <string>
#include <vector>

namespace osim::imageio {

using LoadResult = core::Result<color::Image, core::ImageDecodeError>;

// Decodes an image file (any format the OpenCV build supports) into an RGB
// buffer. Missing, unsupported or corrupt files yield kUnreadable.
[[nodiscard]] LoadResult load_image(const std::string& path);

// Same as load_image for an in-memory encoded image (PNG, JPEG, ...).
[[nodiscard]] LoadResult decode_image(const std::vector<std::uint8_t>& encoded);

}  // namespace osim::imageio
