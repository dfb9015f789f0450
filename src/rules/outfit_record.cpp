#include "osim/rules/outfit_record.h"

#include "osim/color/color_classifier.h"

#include <array>

namespace osim::rules {

namespace {

struct NamedBrightness {
  std::string_view name;
  double brightness;
};

constexpr double kUnknownNameBrightness = 128.0;

constexpr std::array<NamedBrightness, 19> kNamedBrightness = {{
    {"black", 0.0},
    {"deep-blue", 50.0},
    {"deep-green", 50.0},
    {"deep-red", 50.0},
    {"deep-purple", 50.0},
    {"gray", 128.0},
    {"brown", 100.0},
    {"blue", 150.0},
    {"green", 150.0},
    {"red", 150.0},
    {"purple", 150.0},
    {"pale-blue", 200.0},
    {"pale-green", 200.0},
    {"pink", 220.0},
    {"pale-purple", 200.0},
    {"white", 255.0},
    {"pale-yellow", 240.0},
    {"yellow", 220.0},
    {"orange", 200.0},
}};

std::vector<ColorSpec> or_fallback(const std::optional<std::vector<ColorSpec>>& specific,
                                   const std::vector<ColorSpec>& fallback) {
  if (specific.has_value() && !specific->empty()) {
    return *specific;
  }
  return fallback;
}

}  // namespace

OutfitRecord make_outfit_record(const OutfitInput& input) {
  OutfitRecord record;
  record.colors = input.colors.value_or(std::vector<ColorSpec>{});
  record.styles = input.styles.value_or(StyleMap{});
  record.context = input.context.value_or(ContextMap{});
  record.top_colors = or_fallback(input.top_colors, record.colors);
  record.bottom_colors = or_fallback(input.bottom_colors, record.colors);
  return record;
}

std::string color_spec_name(const ColorSpec& spec) {
  if (const auto* rgb = std::get_if<color::Color>(&spec)) {
    return std::string(color::color_name_to_string(color::classify_color_type(*rgb).name));
  }
  return std::get<std::string>(spec);
}

std::optional<color::ColorName> color_spec_palette_name(const ColorSpec& spec) {
  if (const auto* rgb = std::get_if<color::Color>(&spec)) {
    return color::classify_color_type(*rgb).name;
  }
  return color::parse_color_name(std::get<std::string>(spec));
}

double color_spec_brightness(const ColorSpec& spec) {
  if (const auto* rgb = std::get_if<color::Color>(&spec)) {
    return color::brightness(*rgb);
  }
  return named_color_brightness(std::get<std::string>(spec));
}

double named_color_brightness(std::string_view name) noexcept {
  for (const auto& entry : kNamedBrightness) {
    if (entry.name == name) {
      return entry.brightness;
    }
  }
  return kUnknownNameBrightness;
}

}  // namespace osim::rules
