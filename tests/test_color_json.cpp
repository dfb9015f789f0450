#include "osim/color/color_json.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace osim::color;
using nlohmann::json;

TEST_CASE("color_from_json validates triples", "[color][json]") {
  CHECK(color_from_json(json::array({12, 0, 255})) == Color{12, 0, 255});
  CHECK(color_to_json(Color{1, 2, 3}) == json::array({1, 2, 3}));

  CHECK_THROWS_AS(color_from_json(json::array({1, 2})), std::invalid_argument);
  CHECK_THROWS_AS(color_from_json(json::array({1, 2, 3, 4})), std::invalid_argument);
  CHECK_THROWS_AS(color_from_json(json::array({0, 256, 0})), std::invalid_argument);
  CHECK_THROWS_AS(color_from_json(json::array({-1, 0, 0})), std::invalid_argument);
  CHECK_THROWS_AS(color_from_json(json::array({"a", 0, 0})), std::invalid_argument);
  CHECK_THROWS_AS(color_from_json(json("red")), std::invalid_argument);
}

TEST_CASE("dominant colors serialize with names and rounded shares", "[color][json]") {
  const std::vector<DominantColor> colors = {
      DominantColor{Color{0, 0, 0}, 200.0 / 3.0},
      DominantColor{Color{255, 255, 255}, 100.0 / 3.0},
  };
  const auto j = dominant_colors_to_json(colors);

  REQUIRE(j.size() == 2);
  CHECK(j[0]["rgb"] == json::array({0, 0, 0}));
  CHECK(j[0]["percentage"].get<double>() == Catch::Approx(66.67));
  CHECK(j[0]["name"] == "black");
  CHECK(j[0]["tone"] == "neutral");
  CHECK(j[1]["percentage"].get<double>() == Catch::Approx(33.33));
}

TEST_CASE("combo evaluation JSON always carries the analysis", "[color][json]") {
  const auto j = combo_evaluation_to_json(evaluate_color_combo({}));
  CHECK(j["score"].get<double>() == 0.0);
  REQUIRE(j.contains("analysis"));
  CHECK(j["analysis"]["color_count"] == 0);
  CHECK(j["analysis"]["color_types"].is_array());
  CHECK(j["analysis"]["contrast_scores"].empty());
}
