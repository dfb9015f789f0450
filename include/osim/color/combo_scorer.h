#pragma once

#include "osim/color/color.h"

#include <cstddef>
#include <string>
#include <vector>

namespace osim::color {

struct ComboAnalysis {
  std::size_t color_count{0};
  std::vector<ColorName> color_types;  // one per input color, input order
  std::vector<Tone> tones;             // one per input color, input order
  std::vector<double> contrast_scores; // pairwise distances, pairs (i, j) with i < j
};

struct ComboEvaluation {
  double score{0.0};  // [0, 100], one decimal
  std::vector<std::string> suggestions;
  ComboAnalysis analysis;
};

// Scores a color combination starting from 100 and applying cumulative penalties
// for color count, unbalanced warm/cold mixes, contrast extremes and
// complementary clashes. An empty input is not an error: it scores 0 with a
// prompt to supply a color.
[[nodiscard]] ComboEvaluation evaluate_color_combo(const std::vector<Color>& colors);

}  // namespace osim::color
