#pragma once

#include "osim/color/color.h"

namespace osim::color {

// classify_color_type maps an RGB triple onto the fixed name/tone palette.
//
// Predicates are evaluated in a fixed order and the first match wins:
//   1. achromatic (channel spread < 30): black / white / gray by brightness
//   2. brown
//   3. yellow / orange
//   4. red family
//   5. green family
//   6. blue family
//   7. purple family
//   8. fallback on the dominant channel
// The predicates overlap, so reordering them changes results near the thresholds.
// Pure and thread-safe.
[[nodiscard]] ColorClassification classify_color_type(const Color& c) noexcept;

}  // namespace osim::color
