#pragma once

#include "osim/color/color.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace osim::rules {

// A garment color is either an RGB triple or a palette name ("navy" and other
// names outside the palette are accepted and carried as given).
using ColorSpec = std::variant<color::Color, std::string>;

// Slot ("top", "bottom", "shoes") -> garment label.
using StyleMap = std::map<std::string, std::string>;

// Context attributes; "type" selects the occasion ("business", "sport", ...).
// Non-string JSON values are carried as their compact JSON text.
using ContextMap = std::map<std::string, std::string>;

// Caller-facing evaluation request. Every section is optional.
struct OutfitInput {
  std::optional<std::vector<ColorSpec>> colors;
  std::optional<StyleMap> styles;
  std::optional<ContextMap> context;
  std::optional<std::vector<ColorSpec>> top_colors;
  std::optional<std::vector<ColorSpec>> bottom_colors;
};

// Normalized outfit handed to each rule. top_colors and bottom_colors are
// never absent: they fall back to `colors` when not supplied or empty.
struct OutfitRecord {
  std::vector<ColorSpec> colors;
  StyleMap styles;
  ContextMap context;
  std::vector<ColorSpec> top_colors;
  std::vector<ColorSpec> bottom_colors;
};

[[nodiscard]] OutfitRecord make_outfit_record(const OutfitInput& input);

// Wire name of a color: classified for RGB, as given for strings.
[[nodiscard]] std::string color_spec_name(const ColorSpec& spec);

// Palette entry for a color, or nullopt for names outside the palette.
[[nodiscard]] std::optional<color::ColorName> color_spec_palette_name(const ColorSpec& spec);

// Luminance for RGB; fixed per-name table for strings (128 for unknown names).
[[nodiscard]] double color_spec_brightness(const ColorSpec& spec);

[[nodiscard]] double named_color_brightness(std::string_view name) noexcept;

}  // namespace osim::rules
