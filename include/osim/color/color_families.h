#pragma once

#include "osim/color/color.h"

#include <span>
#include <vector>

namespace osim::color {

// A pair of mutually complementary color families. An outfit containing a
// member of `first` and a member of `second` is a complementary clash.
struct ComplementaryPair {
  std::span<const ColorName> first;
  std::span<const ColorName> second;
};

// Red/green, blue/orange-yellow and yellow/purple families. Shared by the
// combo scorer and the forbidden-combination rule.
[[nodiscard]] std::span<const ComplementaryPair> complementary_pairs() noexcept;

// True when `names` hits both sides of any complementary pair.
[[nodiscard]] bool has_complementary_clash(const std::vector<ColorName>& names) noexcept;

}  // namespace osim::color
