#include "osim/color/color_metrics.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace osim::color;

TEST_CASE("color distance is euclidean in RGB", "[color][metrics]") {
  CHECK(color_distance(Color{0, 0, 0}, Color{3, 4, 0}) == Catch::Approx(5.0));
  CHECK(color_distance(Color{10, 20, 30}, Color{10, 20, 30}) == 0.0);
  CHECK(color_distance(Color{100, 100, 100}, Color{110, 110, 110}) ==
        Catch::Approx(17.32).epsilon(0.001));

  SECTION("symmetric") {
    const Color a{12, 200, 7};
    const Color b{90, 3, 250};
    CHECK(color_distance(a, b) == color_distance(b, a));
  }

  SECTION("black to white is the maximum") {
    CHECK(color_distance(Color{0, 0, 0}, Color{255, 255, 255}) ==
          Catch::Approx(kMaxColorDistance));
  }
}
