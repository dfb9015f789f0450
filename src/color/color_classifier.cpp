#include "osim/color/color_classifier.h"

#include <algorithm>

namespace osim::color {

namespace {

constexpr int kAchromaticSpread = 30;
constexpr double kBlackBrightness = 30.0;
constexpr double kWhiteBrightness = 225.0;
constexpr double kPaleBrightness = 200.0;

ColorClassification warm(ColorName name) {
  return ColorClassification{name, Tone::kWarm};
}

ColorClassification cold(ColorName name) {
  return ColorClassification{name, Tone::kCold};
}

ColorClassification neutral(ColorName name) {
  return ColorClassification{name, Tone::kNeutral};
}

// Pale / deep / plain variant selection shared by the green, blue and purple families.
ColorClassification cold_family(double luma, ColorName pale, ColorName deep, ColorName plain) {
  if (luma > kPaleBrightness) {
    return cold(pale);
  }
  if (luma < 100.0) {
    return cold(deep);
  }
  return cold(plain);
}

}  // namespace

ColorClassification classify_color_type(const Color& c) noexcept {
  const int r = c.r;
  const int g = c.g;
  const int b = c.b;
  const double luma = brightness(c);

  const int max_val = std::max({r, g, b});
  const int min_val = std::min({r, g, b});

  if (max_val - min_val < kAchromaticSpread) {
    if (luma < kBlackBrightness) {
      return neutral(ColorName::kBlack);
    }
    if (luma > kWhiteBrightness) {
      return neutral(ColorName::kWhite);
    }
    return neutral(ColorName::kGray);
  }

  const int total = r + g + b;
  if (total == 0) {
    return neutral(ColorName::kBlack);
  }

  const double r_ratio = static_cast<double>(r) / total;
  const double g_ratio = static_cast<double>(g) / total;
  const double b_ratio = static_cast<double>(b) / total;

  // Brown is a dark orange-red and must be tested before the yellow and red families.
  if (luma < 150.0 && r > 50 && g > 30 && b < std::min(r, g) * 0.7 && r > b && g > b) {
    return warm(ColorName::kBrown);
  }

  if (r_ratio > 0.35 && g_ratio > 0.3 && r > b && g > b) {
    if (r > g * 1.15 && g > 100) {
      return warm(ColorName::kOrange);
    }
    if (luma > kPaleBrightness) {
      return warm(ColorName::kPaleYellow);
    }
    return warm(ColorName::kYellow);
  }

  if (r_ratio > 0.4 && r > g && r > b) {
    if (luma > kPaleBrightness) {
      return warm(ColorName::kPink);
    }
    if (luma < 80.0) {
      return warm(ColorName::kDeepRed);
    }
    return warm(ColorName::kRed);
  }

  if (g_ratio > 0.35 && g > r && g > b) {
    return cold_family(luma, ColorName::kPaleGreen, ColorName::kDeepGreen, ColorName::kGreen);
  }

  if (b_ratio > 0.4 && b > r && b > g) {
    return cold_family(luma, ColorName::kPaleBlue, ColorName::kDeepBlue, ColorName::kBlue);
  }

  if (r_ratio > 0.3 && b_ratio > 0.3 && r > g && b > g) {
    return cold_family(luma, ColorName::kPalePurple, ColorName::kDeepPurple, ColorName::kPurple);
  }

  if (max_val == r) {
    return warm(ColorName::kRed);
  }
  if (max_val == g) {
    return cold(ColorName::kGreen);
  }
  return cold(ColorName::kBlue);
}

}  // namespace osim::color
