#include "osim/rules/rule_library.h"
#include "osim/rules/rules/three_color_rule.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace osim::rules;

namespace {

std::vector<std::string> names_of(const std::vector<const OutfitRule*>& rules) {
  std::vector<std::string> out;
  for (const auto* rule : rules) {
    out.push_back(rule->name());
  }
  return out;
}

}  // namespace

TEST_CASE("default library registers the built-in rules in order", "[rules][library]") {
  const auto library = make_default_rule_library();
  REQUIRE(library.size() == 5);
  CHECK(names_of(library.all()) ==
        std::vector<std::string>{"three_color", "light_top_dark_bottom", "forbidden_color_combo",
                                 "style_coordination", "context_appropriate"});
  CHECK(library.get_enabled().size() == 5);

  SECTION("a default-constructed library starts empty") {
    const RuleLibrary empty;
    CHECK(empty.size() == 0);
    CHECK(empty.get_enabled().empty());
  }
}

TEST_CASE("rule names are unique", "[rules][library]") {
  auto library = make_default_rule_library();
  CHECK_FALSE(library.add(std::make_unique<ThreeColorRule>(4)));
  CHECK_FALSE(library.add(nullptr));
  CHECK(library.size() == 5);

  SECTION("remove then re-add") {
    CHECK(library.remove("three_color"));
    CHECK_FALSE(library.remove("three_color"));
    CHECK(library.get("three_color") == nullptr);
    CHECK(library.add(std::make_unique<ThreeColorRule>(4)));
    CHECK(library.all().back()->name() == "three_color");
  }
}

TEST_CASE("enable and disable toggle one rule", "[rules][library]") {
  auto library = make_default_rule_library();

  CHECK(library.disable("forbidden_color_combo"));
  CHECK(library.get_enabled().size() == 4);
  CHECK_FALSE(library.get("forbidden_color_combo")->enabled());

  CHECK(library.enable("forbidden_color_combo"));
  CHECK(library.get_enabled().size() == 5);

  CHECK_FALSE(library.disable("no_such_rule"));
  CHECK_FALSE(library.enable("no_such_rule"));
}

TEST_CASE("configure applies weight and enabled overrides", "[rules][library]") {
  auto library = make_default_rule_library();

  CHECK(library.configure("three_color", 2.5, false));
  CHECK(library.get("three_color")->weight() == 2.5);
  CHECK_FALSE(library.get("three_color")->enabled());

  SECTION("absent fields leave the rule untouched") {
    CHECK(library.configure("three_color", std::nullopt, true));
    CHECK(library.get("three_color")->weight() == 2.5);
    CHECK(library.get("three_color")->enabled());
  }

  SECTION("non-positive weight is rejected without changes") {
    CHECK_FALSE(library.configure("three_color", 0.0, true));
    CHECK(library.get("three_color")->weight() == 2.5);
    CHECK_FALSE(library.get("three_color")->enabled());
  }

  CHECK_FALSE(library.configure("no_such_rule", 1.0, true));
}
