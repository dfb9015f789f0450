#include "osim/color/color_metrics.h"

#include <cmath>

namespace osim::color {

double color_distance(const Color& a, const Color& b) noexcept {
  const double dr = static_cast<double>(a.r) - static_cast<double>(b.r);
  const double dg = static_cast<double>(a.g) - static_cast<double>(b.g);
  const double db = static_cast<double>(a.b) - static_cast<double>(b.b);
  return std::sqrt(dr * dr + dg * dg + db * db);
}

}  // namespace osim::color
