#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace osim::color {

// Color is an opaque RGB triple, each channel in [0,255].
struct Color {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  friend bool operator==(const Color&, const Color&) = default;
};

// Perceptual luminance: 0.299 R + 0.587 G + 0.114 B, range [0,255].
[[nodiscard]] constexpr double brightness(const Color& c) noexcept {
  return 0.299 * c.r + 0.587 * c.g + 0.114 * c.b;
}

// Fixed palette produced by the classifier. Order is the palette index order.
enum class ColorName {
  kRed,
  kDeepRed,
  kPink,
  kOrange,
  kYellow,
  kPaleYellow,
  kGreen,
  kDeepGreen,
  kPaleGreen,
  kBlue,
  kDeepBlue,
  kPaleBlue,
  kPurple,
  kDeepPurple,
  kPalePurple,
  kBrown,
  kBlack,
  kWhite,
  kGray,
};

inline constexpr std::size_t kPaletteSize = 19;

enum class Tone {
  kWarm,
  kCold,
  kNeutral,
};

struct ColorClassification {
  ColorName name{ColorName::kBlack};
  Tone tone{Tone::kNeutral};

  friend bool operator==(const ColorClassification&, const ColorClassification&) = default;
};

// Wire names ("deep-red", "pale-blue", ...).
[[nodiscard]] std::string_view color_name_to_string(ColorName name) noexcept;
[[nodiscard]] std::optional<ColorName> parse_color_name(std::string_view text) noexcept;

// Wire names "warm" / "cold" / "neutral".
[[nodiscard]] std::string_view tone_to_string(Tone tone) noexcept;

// Palette lookup by index. Throws core::InvalidClassIndex when index >= kPaletteSize.
[[nodiscard]] ColorName color_name_at(std::size_t index);

// Tone implied by a palette name (black/white/gray are neutral).
[[nodiscard]] Tone tone_of(ColorName name) noexcept;

[[nodiscard]] inline bool is_neutral(ColorName name) noexcept {
  return name == ColorName::kBlack || name == ColorName::kWhite || name == ColorName::kGray;
}

}  // namespace osim::color
