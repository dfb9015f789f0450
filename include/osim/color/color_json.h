#pragma once

#include "osim/color/color.h"
#include "osim/color/color_extractor.h"
#include "osim/color/combo_scorer.h"

#include <nlohmann/json.hpp>

#include <vector>

namespace osim::color {

/// [r, g, b]
[[nodiscard]] nlohmann::json color_to_json(const Color& c);

/// Parse [r, g, b]. Throws std::invalid_argument on a non-array, a wrong
/// arity, a non-integer channel or a channel outside [0, 255].
[[nodiscard]] Color color_from_json(const nlohmann::json& j);

/// {"name": ..., "tone": ...}
[[nodiscard]] nlohmann::json classification_to_json(const ColorClassification& cls);

/// [{"rgb": [r,g,b], "percentage": p (2 decimals), "name": ..., "tone": ...}, ...]
[[nodiscard]] nlohmann::json dominant_colors_to_json(const std::vector<DominantColor>& colors);

/// {"score", "suggestions", "analysis": {"color_count", "color_types", "tones", "contrast_scores"}}
[[nodiscard]] nlohmann::json combo_evaluation_to_json(const ComboEvaluation& eval);

}  // namespace osim::color
