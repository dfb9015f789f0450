#include "osim/advice/context_recommendations.h"

#include <array>

namespace osim::advice {

namespace {

struct Entry {
  std::string_view type;
  std::vector<std::string> colors;
  std::string top;
  std::string bottom;
  std::string shoes;
  std::vector<std::string> tips;
};

const std::array<Entry, 5>& table() {
  static const std::array<Entry, 5> entries = {{
      {"formal occasion",
       {"black", "white", "gray", "deep-blue", "dark-gray"},
       "shirt",
       "casual-pants",
       "leather-shoes",
       {"Choose a classic black, white and gray palette",
        "Keep to formal pieces and avoid loud patterns",
        "Leather shoes are the best choice for formal occasions",
        "Keep the overall look clean and understated"}},
      {"business",
       {"deep-blue", "dark-gray", "white", "black"},
       "shirt",
       "casual-pants",
       "leather-shoes",
       {"Business settings favor a steady, composed look", "Darker colors read as more professional",
        "Keep the outfit neat and well kept", "Avoid overly bright colors"}},
      {"work",
       {"white", "blue", "gray", "black"},
       "shirt",
       "casual-pants",
       "leather-shoes",
       {"Look professional without losing energy", "A bright accent color works well",
        "Comfort matters too", "Pick breathable fabrics"}},
      {"casual",
       {"white", "blue", "gray", "black", "brown"},
       "t-shirt",
       "jeans",
       "sneakers",
       {"Casual settings allow more freedom", "Choose comfortable pieces",
        "Colors can be richer", "Aim for an overall coordinated look"}},
      {"sport",
       {"black", "white", "gray", "blue", "red"},
       "t-shirt",
       "casual-pants",
       "sneakers",
       {"Comfort comes first for sport", "Choose breathable materials",
        "Colors can be brighter", "Sneakers are essential"}},
  }};
  return entries;
}

const Entry& casual_entry() {
  return table()[3];
}

}  // namespace

ContextRecommendation recommend_for_context(std::string_view context_type) {
  const Entry* match = &casual_entry();
  for (const auto& entry : table()) {
    if (entry.type == context_type) {
      match = &entry;
      break;
    }
  }

  return ContextRecommendation{std::string(context_type), match->colors, match->top,
                               match->bottom, match->shoes, match->tips};
}

std::vector<std::string> known_context_types() {
  std::vector<std::string> types;
  for (const auto& entry : table()) {
    types.emplace_back(entry.type);
  }
  return types;
}

nlohmann::json recommendation_to_json(const ContextRecommendation& rec) {
  nlohmann::json j;
  j["context"] = rec.context;
  j["recommendations"] = rec.tips;
  j["color_suggestions"] = rec.colors;
  j["style_suggestions"] = {{"top", rec.top}, {"bottom", rec.bottom}, {"shoes", rec.shoes}};
  return j;
}

}  // namespace osim::advice
