#include "osim/garment/style_taxonomy.h"
#include "osim/rules/outfit_record.h"
#include "osim/rules/rules/context_appropriate_rule.h"
#include "osim/rules/rules/forbidden_color_combo_rule.h"
#include "osim/rules/rules/light_top_dark_bottom_rule.h"
#include "osim/rules/rules/style_coordination_rule.h"
#include "osim/rules/rules/three_color_rule.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace osim;
using namespace osim::rules;

namespace {

std::vector<ColorSpec> names(std::initializer_list<const char*> list) {
  std::vector<ColorSpec> out;
  for (const char* n : list) {
    out.emplace_back(std::string(n));
  }
  return out;
}

OutfitRecord with_colors(std::vector<ColorSpec> colors) {
  OutfitInput input;
  input.colors = std::move(colors);
  return make_outfit_record(input);
}

OutfitRecord with_styles(StyleMap styles, ContextMap context = {}) {
  OutfitInput input;
  input.styles = std::move(styles);
  input.context = std::move(context);
  return make_outfit_record(input);
}

}  // namespace

TEST_CASE("outfit record falls back to the full color list", "[rules][record]") {
  OutfitInput input;
  input.colors = names({"white", "black"});
  input.top_colors = std::vector<ColorSpec>{};
  input.bottom_colors = names({"black"});

  const auto record = make_outfit_record(input);
  CHECK(record.top_colors.size() == 2);
  CHECK(record.bottom_colors.size() == 1);
  CHECK(record.styles.empty());

  CHECK(color_spec_name(ColorSpec{color::Color{0, 0, 0}}) == "black");
  CHECK(color_spec_name(ColorSpec{std::string("navy")}) == "navy");
  CHECK_FALSE(color_spec_palette_name(ColorSpec{std::string("navy")}).has_value());
  CHECK(named_color_brightness("white") == 255.0);
  CHECK(named_color_brightness("navy") == 128.0);
}

TEST_CASE("three_color counts distinct non-neutral colors", "[rules][three_color]") {
  const ThreeColorRule rule;
  CHECK(rule.name() == "three_color");
  CHECK(rule.weight() == ThreeColorRule::kDefaultWeight);

  SECTION("four hues cost one step") {
    const auto result = rule.evaluate(with_colors(names({"red", "green", "blue", "yellow"})));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(80.0));
    CHECK(result.severity == Severity::kWarning);
    CHECK(result.suggestion.has_value());
    CHECK(result.weight == ThreeColorRule::kDefaultWeight);
  }

  SECTION("neutrals and duplicates are not main colors") {
    const auto result =
        rule.evaluate(with_colors(names({"red", "red", "black", "white", "gray", "blue"})));
    CHECK(result.passed);
    CHECK(result.score == 100.0);
    CHECK(result.severity == Severity::kInfo);
  }

  SECTION("custom limit") {
    const ThreeColorRule strict(2);
    const auto result = strict.evaluate(with_colors(names({"red", "blue", "yellow"})));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(80.0));
  }

  SECTION("no colors skips the check") {
    const auto result = rule.evaluate(OutfitRecord{});
    CHECK(result.passed);
    CHECK(result.score == 100.0);
  }
}

TEST_CASE("light_top_dark_bottom compares average brightness", "[rules][light_top]") {
  const LightTopDarkBottomRule rule;

  SECTION("light over dark passes") {
    OutfitInput input;
    input.colors = names({"white", "black"});
    input.top_colors = names({"white"});
    input.bottom_colors = names({"black"});
    const auto result = rule.evaluate(make_outfit_record(input));
    CHECK(result.passed);
    CHECK(result.score == 100.0);
  }

  SECTION("dark over light is penalized by half the gap") {
    OutfitInput input;
    input.colors = names({"navy", "white"});
    input.top_colors = names({"navy"});
    input.bottom_colors = names({"white"});
    const auto result = rule.evaluate(make_outfit_record(input));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(36.5));
    CHECK(result.severity == Severity::kWarning);
    CHECK(result.message.find("top brightness: 128.0") != std::string::npos);
  }

  SECTION("penalty is floored at zero") {
    OutfitInput input;
    input.colors = names({"black", "white"});
    input.top_colors = names({"black"});
    input.bottom_colors = names({"white"});
    CHECK(rule.evaluate(make_outfit_record(input)).score == 0.0);
  }

  SECTION("without separate lists top and bottom are equal") {
    CHECK(rule.evaluate(with_colors(names({"black", "red"}))).passed);
  }
}

TEST_CASE("forbidden_color_combo flags complementary families", "[rules][forbidden]") {
  const ForbiddenColorComboRule rule;

  SECTION("red with green is an error") {
    const auto result = rule.evaluate(with_colors(names({"red", "green"})));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(50.0));
    CHECK(result.severity == Severity::kError);
    CHECK(result.message.find("with") != std::string::npos);
  }

  SECTION("a neutral does not excuse the clash") {
    const auto result = rule.evaluate(with_colors(names({"pale-yellow", "white", "deep-purple"})));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(50.0));
  }

  SECTION("RGB colors are classified first") {
    const auto result = rule.evaluate(
        with_colors({ColorSpec{color::Color{0, 0, 255}}, ColorSpec{color::Color{255, 165, 0}}}));
    CHECK_FALSE(result.passed);
  }

  SECTION("harmless and unknown names pass") {
    const auto result = rule.evaluate(with_colors(names({"blue", "white", "navy"})));
    CHECK(result.passed);
    CHECK(result.score == 100.0);
  }
}

TEST_CASE("style_coordination grades category mixes", "[rules][style]") {
  const StyleCoordinationRule rule;

  SECTION("one category") {
    const auto result = rule.evaluate(with_styles({{"top", "shirt"}, {"shoes", "leather-shoes"}}));
    CHECK(result.passed);
    CHECK(result.score == 100.0);
  }

  SECTION("two categories still pass with a warning") {
    const auto result = rule.evaluate(with_styles({{"top", "shirt"}, {"bottom", "jeans"}}));
    CHECK(result.passed);
    CHECK(result.score == Catch::Approx(70.0));
    CHECK(result.severity == Severity::kWarning);
  }

  SECTION("unknown labels are ignored") {
    const auto result = rule.evaluate(with_styles({{"top", "scarf"}}));
    CHECK(result.passed);
    CHECK(result.score == 100.0);
  }

  SECTION("three categories under an extended taxonomy fail") {
    const StyleCoordinationRule extended(
        garment::StyleTaxonomy(std::vector<garment::StyleTaxonomy::Category>{
            {"formal", {"shirt"}},
            {"casual", {"jeans"}},
            {"sport", {"running-shoes"}},
        }),
        StyleCoordinationRule::kDefaultWeight);
    const auto result = extended.evaluate(
        with_styles({{"top", "shirt"}, {"bottom", "jeans"}, {"shoes", "running-shoes"}}));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(40.0));
    CHECK(result.severity == Severity::kError);
  }
}

TEST_CASE("context_appropriate checks pieces against the occasion", "[rules][context]") {
  const ContextAppropriateRule rule;

  SECTION("formal occasion in casual wear") {
    const auto result = rule.evaluate(
        with_styles({{"top", "t-shirt"}, {"bottom", "jeans"}}, {{"type", "formal occasion"}}));
    CHECK_FALSE(result.passed);
    CHECK(result.score == Catch::Approx(60.0));
    CHECK(result.severity == Severity::kWarning);
    REQUIRE(result.suggestion.has_value());
    CHECK(*result.suggestion == "Choose formal pieces such as a shirt, coat or leather shoes");
  }

  SECTION("sport in formal wear") {
    const auto result = rule.evaluate(with_styles({{"top", "shirt"}}, {{"type", "sport"}}));
    CHECK_FALSE(result.passed);
    REQUIRE(result.suggestion.has_value());
    CHECK(*result.suggestion == "Choose casual pieces such as a t-shirt, jeans or sneakers");
  }

  SECTION("one matching piece is enough") {
    const auto result = rule.evaluate(
        with_styles({{"top", "shirt"}, {"bottom", "jeans"}}, {{"type", "business"}}));
    CHECK(result.passed);
    CHECK(result.score == 100.0);
  }

  SECTION("unmapped or missing types pass") {
    CHECK(rule.evaluate(with_styles({{"top", "t-shirt"}}, {{"type", "wedding"}})).passed);
    CHECK(rule.evaluate(with_styles({{"top", "t-shirt"}}, {{"venue", "home"}})).passed);
  }

  CHECK(ContextAppropriateRule::recommended_categories("work").size() == 2);
  CHECK(ContextAppropriateRule::recommended_categories("wedding").empty());
}

TEST_CASE("rule weights must stay positive", "[rules][weight]") {
  CHECK_THROWS_AS(ThreeColorRule(3, 0.0), std::invalid_argument);
  CHECK_THROWS_AS(ForbiddenColorComboRule(-1.0), std::invalid_argument);

  LightTopDarkBottomRule rule;
  CHECK_THROWS_AS(rule.set_weight(0.0), std::invalid_argument);
  CHECK(rule.weight() == LightTopDarkBottomRule::kDefaultWeight);

  rule.set_weight(2.5);
  CHECK(rule.evaluate(with_colors(names({"white"}))).weight == 2.5);
}
