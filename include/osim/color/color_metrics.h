#pragma once

#include "osim/color/color.h"

namespace osim::color {

// Largest possible distance: sqrt(3 * 255^2).
inline constexpr double kMaxColorDistance = 441.6729559300637;

// Euclidean distance over (R,G,B). Symmetric, zero iff the colors are identical.
[[nodiscard]] double color_distance(const Color& a, const Color& b) noexcept;

}  // namespace osim::color
