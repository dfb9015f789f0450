#include "osim/rules/evaluation_json.h"
#include "osim/rules/rule_evaluator.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

using namespace osim;
using namespace osim::rules;
using nlohmann::json;

TEST_CASE("outfit_input_from_json parses every section", "[rules][json]") {
  const auto input = outfit_input_from_json(json::parse(R"({
    "colors": [[255, 0, 0], "navy"],
    "styles": {"top": "shirt", "bottom": "jeans"},
    "context": {"type": "business"},
    "top_colors": null
  })"));

  REQUIRE(input.colors.has_value());
  REQUIRE(input.colors->size() == 2);
  REQUIRE(std::holds_alternative<color::Color>((*input.colors)[0]));
  CHECK(std::get<color::Color>((*input.colors)[0]) == color::Color{255, 0, 0});
  CHECK(std::get<std::string>((*input.colors)[1]) == "navy");

  REQUIRE(input.styles.has_value());
  CHECK(input.styles->at("bottom") == "jeans");
  REQUIRE(input.context.has_value());
  CHECK(input.context->at("type") == "business");

  CHECK_FALSE(input.top_colors.has_value());
  CHECK_FALSE(input.bottom_colors.has_value());
}

TEST_CASE("outfit_input_from_json rejects malformed requests", "[rules][json]") {
  CHECK_THROWS_AS(outfit_input_from_json(json::array()), std::invalid_argument);
  CHECK_THROWS_AS(outfit_input_from_json(json::parse(R"({"colors": "red"})")),
                  std::invalid_argument);
  CHECK_THROWS_AS(outfit_input_from_json(json::parse(R"({"colors": [[1, 2]]})")),
                  std::invalid_argument);
  CHECK_THROWS_AS(outfit_input_from_json(json::parse(R"({"colors": [[1, 2, 300]]})")),
                  std::invalid_argument);
  CHECK_THROWS_AS(outfit_input_from_json(json::parse(R"({"styles": ["shirt"]})")),
                  json::exception);
  CHECK_THROWS_AS(outfit_input_from_json(json::parse(R"({"context": "work"})")),
                  std::invalid_argument);
}

TEST_CASE("context accepts values of any JSON type", "[rules][json]") {
  const auto input = outfit_input_from_json(json::parse(R"({
    "colors": ["white", "black"],
    "styles": {"top": "t-shirt"},
    "context": {"type": "business", "temperature": 20, "indoor": true, "tags": ["office"]}
  })"));

  REQUIRE(input.context.has_value());
  CHECK(input.context->at("type") == "business");
  CHECK(input.context->at("temperature") == "20");
  CHECK(input.context->at("indoor") == "true");
  CHECK(input.context->at("tags") == R"(["office"])");

  SECTION("the occasion rule still reads the type") {
    auto library = make_default_rule_library();
    const RuleEvaluator evaluator(library);
    const auto report = evaluator.evaluate_outfit(input);
    const auto it = std::find_if(report.results.begin(), report.results.end(),
                                 [](const auto& r) { return r.rule_name == "context_appropriate"; });
    REQUIRE(it != report.results.end());
    CHECK_FALSE(it->passed);
    CHECK(it->score == Catch::Approx(60.0));
  }
}

TEST_CASE("evaluation report JSON keeps every field", "[rules][json]") {
  auto library = make_default_rule_library();
  const RuleEvaluator evaluator(library);
  OutfitInput input;
  input.colors = std::vector<ColorSpec>{std::string("red"), std::string("green")};
  const auto report = evaluator.evaluate_outfit(input);

  const auto j = evaluation_report_to_json(report);
  CHECK(j["passed"] == false);
  CHECK(j["summary"]["total_rules"] == 5);
  CHECK(j["results"][0]["suggestion"].is_null());
  CHECK(j["results"][2]["severity"] == "error");
  CHECK(j["suggestions"][0]["rule"] == "forbidden_color_combo");

  const auto restored = evaluation_report_from_json(j);
  CHECK(restored.score == Catch::Approx(report.score));
  CHECK(restored.passed == report.passed);
  REQUIRE(restored.results.size() == report.results.size());
  CHECK(restored.results[2].severity == Severity::kError);
  CHECK(restored.results[2].suggestion == report.results[2].suggestion);
  CHECK_FALSE(restored.results[0].suggestion.has_value());
  CHECK(restored.summary.errors == 1);

  SECTION("unknown severity is rejected") {
    auto bad = j;
    bad["results"][0]["severity"] = "fatal";
    CHECK_THROWS_AS(evaluation_report_from_json(bad), std::invalid_argument);
  }
}
