#include "osim/rules/rules/forbidden_color_combo_rule.h"

#include "osim/color/color_families.h"

#include <algorithm>
#include <span>
#include <string>

namespace osim::rules {

namespace {

bool contains_any(const std::vector<color::ColorName>& names,
                  std::span<const color::ColorName> family) {
  return std::any_of(family.begin(), family.end(), [&](color::ColorName member) {
    return std::find(names.begin(), names.end(), member) != names.end();
  });
}

std::string join_family(std::span<const color::ColorName> family) {
  std::string out;
  for (const auto name : family) {
    if (!out.empty()) {
      out += ", ";
    }
    out += color::color_name_to_string(name);
  }
  return out;
}

}  // namespace

ForbiddenColorComboRule::ForbiddenColorComboRule(double weight)
    : ColorRule("forbidden_color_combo",
                "Avoid pairing complementary colors directly (e.g. red/green, purple/yellow)",
                weight) {}

RuleResult ForbiddenColorComboRule::evaluate_colors(const std::vector<ColorSpec>& colors,
                                                    const OutfitRecord& /*outfit*/) const {
  // Names outside the palette cannot belong to a complementary family.
  std::vector<color::ColorName> names;
  for (const auto& spec : colors) {
    if (const auto name = color_spec_palette_name(spec)) {
      names.push_back(*name);
    }
  }

  std::vector<std::string> violations;
  for (const auto& pair : color::complementary_pairs()) {
    if (contains_any(names, pair.first) && contains_any(names, pair.second)) {
      violations.push_back(join_family(pair.first) + " with " + join_family(pair.second));
    }
  }

  RuleResult result;
  if (violations.empty()) {
    result.passed = true;
    result.score = 100.0;
    result.message = "No forbidden color combinations found";
    result.severity = Severity::kInfo;
    return result;
  }

  std::string joined;
  for (const auto& v : violations) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += v;
  }

  result.passed = false;
  result.score = 50.0;
  result.message = "Forbidden color combination: " + joined;
  result.suggestion =
      "Avoid pairing complementary colors directly; use a neutral (black/white/gray) between them";
  result.severity = Severity::kError;
  return result;
}

}  // namespace osim::rules
