#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace osim::advice {

struct ContextRecommendation {
  std::string context;              // the requested context type, echoed back
  std::vector<std::string> colors;  // suggested color names
  std::string top;
  std::string bottom;
  std::string shoes;
  std::vector<std::string> tips;
};

// Recommended colors, pieces and tips for an occasion. Known types:
// "formal occasion", "business", "work", "casual", "sport". Any other type
// receives the casual recommendation (with the requested type echoed).
[[nodiscard]] ContextRecommendation recommend_for_context(std::string_view context_type);

[[nodiscard]] std::vector<std::string> known_context_types();

/// {"context", "recommendations": [tips], "color_suggestions": [...],
///  "style_suggestions": {"top", "bottom", "shoes"}}
[[nodiscard]] nlohmann::json recommendation_to_json(const ContextRecommendation& rec);

}  // namespace osim::advice
