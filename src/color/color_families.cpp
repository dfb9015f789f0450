#include "osim/color/color_families.h"

#include <algorithm>
#include <array>

namespace osim::color {

namespace {

constexpr std::array<ColorName, 3> kReds = {ColorName::kRed, ColorName::kDeepRed,
                                            ColorName::kPink};
constexpr std::array<ColorName, 3> kGreens = {ColorName::kGreen, ColorName::kDeepGreen,
                                              ColorName::kPaleGreen};
constexpr std::array<ColorName, 3> kBlues = {ColorName::kBlue, ColorName::kDeepBlue,
                                             ColorName::kPaleBlue};
constexpr std::array<ColorName, 3> kOrangeYellows = {ColorName::kOrange, ColorName::kYellow,
                                                     ColorName::kPaleYellow};
constexpr std::array<ColorName, 2> kYellows = {ColorName::kYellow, ColorName::kPaleYellow};
constexpr std::array<ColorName, 3> kPurples = {ColorName::kPurple, ColorName::kDeepPurple,
                                               ColorName::kPalePurple};

const std::array<ComplementaryPair, 3> kPairs = {{
    {kReds, kGreens},
    {kBlues, kOrangeYellows},
    {kYellows, kPurples},
}};

bool contains_any(const std::vector<ColorName>& names, std::span<const ColorName> family) {
  return std::any_of(names.begin(), names.end(), [&](ColorName n) {
    return std::find(family.begin(), family.end(), n) != family.end();
  });
}

}  // namespace

std::span<const ComplementaryPair> complementary_pairs() noexcept {
  return kPairs;
}

bool has_complementary_clash(const std::vector<ColorName>& names) noexcept {
  return std::any_of(kPairs.begin(), kPairs.end(), [&](const ComplementaryPair& pair) {
    return contains_any(names, pair.first) && contains_any(names, pair.second);
  });
}

}  // namespace osim::color
