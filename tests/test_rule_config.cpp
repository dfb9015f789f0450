#include "osim/config/rule_config.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace osim;
using nlohmann::json;

TEST_CASE("parse_rule_config accepts valid overrides", "[config][rules]") {
  const auto parsed = config::parse_rule_config(json::parse(R"({
    "rules": {
      "three_color": {"weight": 2.0, "enabled": false},
      "context_appropriate": {"enabled": true}
    }
  })"));
  REQUIRE(parsed.has_value());

  const auto& rules = parsed.value().rules;
  REQUIRE(rules.size() == 2);
  CHECK(rules.at("three_color").weight == 2.0);
  CHECK(rules.at("three_color").enabled == false);
  CHECK_FALSE(rules.at("context_appropriate").weight.has_value());
}

TEST_CASE("parse_rule_config treats a missing rules key as empty", "[config][rules]") {
  const auto parsed = config::parse_rule_config(json::object());
  REQUIRE(parsed.has_value());
  CHECK(parsed.value().rules.empty());
}

TEST_CASE("parse_rule_config rejects malformed documents", "[config][rules]") {
  CHECK_FALSE(config::parse_rule_config(json::array()).has_value());
  CHECK_FALSE(config::parse_rule_config(json::parse(R"({"rules": []})")).has_value());
  CHECK_FALSE(
      config::parse_rule_config(json::parse(R"({"rules": {"three_color": 2}})")).has_value());
  CHECK_FALSE(config::parse_rule_config(json::parse(R"({"rules": {"three_color": {"enabled": "yes"}}})"))
                  .has_value());

  const auto negative =
      config::parse_rule_config(json::parse(R"({"rules": {"three_color": {"weight": -1}}})"));
  REQUIRE_FALSE(negative.has_value());
  CHECK(negative.error().find("three_color") != std::string::npos);
}

TEST_CASE("apply_rule_config configures known rules", "[config][rules]") {
  auto library = rules::make_default_rule_library();
  const auto parsed = config::parse_rule_config(json::parse(R"({
    "rules": {
      "three_color": {"weight": 2.0, "enabled": false},
      "mystery": {"weight": 1.0}
    }
  })"));
  REQUIRE(parsed.has_value());

  const auto unknown = config::apply_rule_config(library, parsed.value());
  CHECK(unknown == std::vector<std::string>{"mystery"});
  CHECK(library.get("three_color")->weight() == 2.0);
  CHECK_FALSE(library.get("three_color")->enabled());
  CHECK(library.get_enabled().size() == 4);
}
