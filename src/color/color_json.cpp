#include "osim/color/color_json.h"

#include "osim/color/color_classifier.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace osim::color {

namespace {

double round_to_hundredth(double value) {
  return std::round(value * 100.0) / 100.0;
}

std::uint8_t channel_from_json(const nlohmann::json& j) {
  const auto value = j.get<long long>();
  if (value < 0 || value > 255) {
    throw std::invalid_argument("color channel out of range [0, 255]: " + std::to_string(value));
  }
  return static_cast<std::uint8_t>(value);
}

}  // namespace

nlohmann::json color_to_json(const Color& c) {
  return nlohmann::json::array({c.r, c.g, c.b});
}

Color color_from_json(const nlohmann::json& j) {
  if (!j.is_array() || j.size() != 3) {
    throw std::invalid_argument("color must be an array of three integers");
  }
  for (const auto& channel : j) {
    if (!channel.is_number_integer()) {
      throw std::invalid_argument("color channels must be integers");
    }
  }
  return Color{channel_from_json(j[0]), channel_from_json(j[1]), channel_from_json(j[2])};
}

nlohmann::json classification_to_json(const ColorClassification& cls) {
  nlohmann::json j;
  j["name"] = std::string(color_name_to_string(cls.name));
  j["tone"] = std::string(tone_to_string(cls.tone));
  return j;
}

nlohmann::json dominant_colors_to_json(const std::vector<DominantColor>& colors) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& dc : colors) {
    const auto cls = classify_color_type(dc.color);
    nlohmann::json entry;
    entry["rgb"] = color_to_json(dc.color);
    entry["percentage"] = round_to_hundredth(dc.percentage);
    entry["name"] = std::string(color_name_to_string(cls.name));
    entry["tone"] = std::string(tone_to_string(cls.tone));
    arr.push_back(entry);
  }
  return arr;
}

nlohmann::json combo_evaluation_to_json(const ComboEvaluation& eval) {
  nlohmann::json analysis;
  analysis["color_count"] = eval.analysis.color_count;

  nlohmann::json types = nlohmann::json::array();
  for (const auto name : eval.analysis.color_types) {
    types.push_back(std::string(color_name_to_string(name)));
  }
  analysis["color_types"] = types;

  nlohmann::json tones = nlohmann::json::array();
  for (const auto tone : eval.analysis.tones) {
    tones.push_back(std::string(tone_to_string(tone)));
  }
  analysis["tones"] = tones;
  analysis["contrast_scores"] = eval.analysis.contrast_scores;

  nlohmann::json j;
  j["score"] = eval.score;
  j["suggestions"] = eval.suggestions;
  j["analysis"] = analysis;
  return j;
}

}  // namespace osim::color
