#include "osim/color/combo_scorer.h"

#include "osim/color/color_classifier.h"
#include "osim/color/color_families.h"
#include "osim/color/color_metrics.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace osim::color {

namespace {

constexpr std::size_t kMaxMainColors = 3;
constexpr double kLowContrast = 50.0;
constexpr double kModerateContrast = 100.0;
constexpr double kHarshContrast = 400.0;

double round_to_tenth(double value) {
  return std::round(value * 10.0) / 10.0;
}

}  // namespace

ComboEvaluation evaluate_color_combo(const std::vector<Color>& colors) {
  ComboEvaluation result;

  if (colors.empty()) {
    result.score = 0.0;
    result.suggestions.emplace_back("Provide at least one color");
    return result;
  }

  result.analysis.color_count = colors.size();
  for (const auto& c : colors) {
    const auto cls = classify_color_type(c);
    result.analysis.color_types.push_back(cls.name);
    result.analysis.tones.push_back(cls.tone);
  }

  if (colors.size() == 1) {
    result.score = 100.0;
    result.suggestions.emplace_back("Single-color outfit: minimalist and elegant");
    return result;
  }

  double score = 100.0;
  auto& suggestions = result.suggestions;
  const auto& tones = result.analysis.tones;

  if (colors.size() > kMaxMainColors) {
    score -= 20.0;
    suggestions.push_back("Keep the main colors to at most 3; the outfit currently has " +
                          std::to_string(colors.size()) + " colors");
  } else if (colors.size() == kMaxMainColors) {
    suggestions.emplace_back("Follows the three-color principle; the combination is coherent");
  }

  const auto warm_count = std::count(tones.begin(), tones.end(), Tone::kWarm);
  const auto cold_count = std::count(tones.begin(), tones.end(), Tone::kCold);
  const auto neutral_count = std::count(tones.begin(), tones.end(), Tone::kNeutral);

  if (warm_count > 0 && cold_count > 0) {
    if (neutral_count == 0) {
      score -= 15.0;
      suggestions.emplace_back(
          "Warm and cold colors together need a neutral (black/white/gray) as a transition");
    } else {
      suggestions.emplace_back("Warm and cold colors are well bridged by the neutral color");
    }
  }

  double min_contrast = std::numeric_limits<double>::infinity();
  double max_contrast = 0.0;
  for (std::size_t i = 0; i < colors.size(); ++i) {
    for (std::size_t j = i + 1; j < colors.size(); ++j) {
      const double contrast = color_distance(colors[i], colors[j]);
      result.analysis.contrast_scores.push_back(contrast);
      min_contrast = std::min(min_contrast, contrast);
      max_contrast = std::max(max_contrast, contrast);
    }
  }

  if (min_contrast < kLowContrast) {
    score -= 20.0;
    suggestions.emplace_back("Some colors are too similar and lack depth; increase the contrast");
  } else if (min_contrast < kModerateContrast) {
    score -= 10.0;
    suggestions.emplace_back("Some colors have low contrast; consider adding more contrast");
  }

  if (max_contrast > kHarshContrast) {
    score -= 10.0;
    suggestions.emplace_back(
        "Some colors contrast too strongly and may look harsh; tone the contrast down");
  }

  if (has_complementary_clash(result.analysis.color_types)) {
    if (neutral_count == 0) {
      score -= 15.0;
      suggestions.emplace_back(
          "Complementary colors detected; add a neutral (black/white/gray) to balance them");
    } else {
      suggestions.emplace_back("Complementary colors are well balanced by the neutral color");
    }
  }

  const auto total = static_cast<std::ptrdiff_t>(colors.size());
  if (neutral_count == total) {
    suggestions.emplace_back("All-neutral combination: classic and safe");
  } else if (neutral_count > 0) {
    suggestions.emplace_back("Neutral and chromatic colors together: balanced and elegant");
  }

  score = std::clamp(score, 0.0, 100.0);
  if (score >= 80.0 && suggestions.empty()) {
    suggestions.emplace_back("The colors are well coordinated");
  }

  result.score = round_to_tenth(score);
  return result;
}

}  // namespace osim::color
