#include "osim/rules/rule_library.h"

#include "osim/rules/rules/context_appropriate_rule.h"
#include "osim/rules/rules/forbidden_color_combo_rule.h"
#include "osim/rules/rules/light_top_dark_bottom_rule.h"
#include "osim/rules/rules/style_coordination_rule.h"
#include "osim/rules/rules/three_color_rule.h"

#include <algorithm>
#include <utility>

namespace osim::rules {

bool RuleLibrary::add(std::unique_ptr<OutfitRule> rule) {
  if (!rule || get(rule->name()) != nullptr) {
    return false;
  }
  rules_.push_back(std::move(rule));
  return true;
}

bool RuleLibrary::remove(std::string_view name) {
  const auto it = std::find_if(rules_.begin(), rules_.end(),
                               [&](const auto& rule) { return rule->name() == name; });
  if (it == rules_.end()) {
    return false;
  }
  rules_.erase(it);
  return true;
}

OutfitRule* RuleLibrary::get(std::string_view name) noexcept {
  for (auto& rule : rules_) {
    if (rule->name() == name) {
      return rule.get();
    }
  }
  return nullptr;
}

const OutfitRule* RuleLibrary::get(std::string_view name) const noexcept {
  for (const auto& rule : rules_) {
    if (rule->name() == name) {
      return rule.get();
    }
  }
  return nullptr;
}

bool RuleLibrary::enable(std::string_view name) noexcept {
  auto* rule = get(name);
  if (rule == nullptr) {
    return false;
  }
  rule->set_enabled(true);
  return true;
}

bool RuleLibrary::disable(std::string_view name) noexcept {
  auto* rule = get(name);
  if (rule == nullptr) {
    return false;
  }
  rule->set_enabled(false);
  return true;
}

bool RuleLibrary::configure(std::string_view name, std::optional<double> weight,
                            std::optional<bool> enabled) {
  auto* rule = get(name);
  if (rule == nullptr) {
    return false;
  }
  if (weight.has_value() && !(*weight > 0.0)) {
    return false;
  }
  if (weight.has_value()) {
    rule->set_weight(*weight);
  }
  if (enabled.has_value()) {
    rule->set_enabled(*enabled);
  }
  return true;
}

std::vector<const OutfitRule*> RuleLibrary::get_enabled() const {
  std::vector<const OutfitRule*> enabled;
  for (const auto& rule : rules_) {
    if (rule->enabled()) {
      enabled.push_back(rule.get());
    }
  }
  return enabled;
}

std::vector<const OutfitRule*> RuleLibrary::all() const {
  std::vector<const OutfitRule*> out;
  out.reserve(rules_.size());
  for (const auto& rule : rules_) {
    out.push_back(rule.get());
  }
  return out;
}

RuleLibrary make_default_rule_library() {
  RuleLibrary library;

  // Fixed evaluation order: color rules, then style, then context.
  (void)library.add(std::make_unique<ThreeColorRule>());
  (void)library.add(std::make_unique<LightTopDarkBottomRule>());
  (void)library.add(std::make_unique<ForbiddenColorComboRule>());
  (void)library.add(std::make_unique<StyleCoordinationRule>());
  (void)library.add(std::make_unique<ContextAppropriateRule>());

  return library;
}

}  // namespace osim::rules
