#include "osim/color/color.h"

#include "osim/core/errors.h"

namespace osim::color {

namespace {

struct PaletteEntry {
  ColorName name;
  std::string_view text;
  Tone tone;
};

// Index order matches ColorName declaration order.
constexpr std::array<PaletteEntry, kPaletteSize> kPalette = {{
    {ColorName::kRed, "red", Tone::kWarm},
    {ColorName::kDeepRed, "deep-red", Tone::kWarm},
    {ColorName::kPink, "pink", Tone::kWarm},
    {ColorName::kOrange, "orange", Tone::kWarm},
    {ColorName::kYellow, "yellow", Tone::kWarm},
    {ColorName::kPaleYellow, "pale-yellow", Tone::kWarm},
    {ColorName::kGreen, "green", Tone::kCold},
    {ColorName::kDeepGreen, "deep-green", Tone::kCold},
    {ColorName::kPaleGreen, "pale-green", Tone::kCold},
    {ColorName::kBlue, "blue", Tone::kCold},
    {ColorName::kDeepBlue, "deep-blue", Tone::kCold},
    {ColorName::kPaleBlue, "pale-blue", Tone::kCold},
    {ColorName::kPurple, "purple", Tone::kCold},
    {ColorName::kDeepPurple, "deep-purple", Tone::kCold},
    {ColorName::kPalePurple, "pale-purple", Tone::kCold},
    {ColorName::kBrown, "brown", Tone::kWarm},
    {ColorName::kBlack, "black", Tone::kNeutral},
    {ColorName::kWhite, "white", Tone::kNeutral},
    {ColorName::kGray, "gray", Tone::kNeutral},
}};

const PaletteEntry& entry_for(ColorName name) noexcept {
  return kPalette[static_cast<std::size_t>(name)];
}

}  // namespace

std::string_view color_name_to_string(ColorName name) noexcept {
  return entry_for(name).text;
}

std::optional<ColorName> parse_color_name(std::string_view text) noexcept {
  for (const auto& entry : kPalette) {
    if (entry.text == text) {
      return entry.name;
    }
  }
  return std::nullopt;
}

std::string_view tone_to_string(Tone tone) noexcept {
  switch (tone) {
    case Tone::kWarm:
      return "warm";
    case Tone::kCold:
      return "cold";
    case Tone::kNeutral:
      return "neutral";
  }
  return "neutral";
}

ColorName color_name_at(std::size_t index) {
  if (index >= kPalette.size()) {
    throw core::InvalidClassIndex("color palette", index, kPalette.size());
  }
  return kPalette[index].name;
}

Tone tone_of(ColorName name) noexcept {
  return entry_for(name).tone;
}

}  // namespace osim::color
