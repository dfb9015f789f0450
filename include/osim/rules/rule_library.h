#pragma once

#include "osim/rules/outfit_rule.h"

#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace osim::rules {

// RuleLibrary is an ordered registry of uniquely named rules. Evaluation order
// is registration order.
//
// A default-constructed library is empty; make_default_rule_library() builds
// the standard library holding the five built-in rules.
//
// Not internally synchronized: concurrent readers of an unmodified library are
// safe, any mutation must be serialized by the caller.
class RuleLibrary {
 public:
  RuleLibrary() = default;

  // Appends a rule. Returns false (and drops the rule) when it is null or its
  // name is already registered.
  [[nodiscard]] bool add(std::unique_ptr<OutfitRule> rule);

  // Returns true when a rule with that name was removed.
  bool remove(std::string_view name);

  // nullptr when no rule has that name.
  [[nodiscard]] OutfitRule* get(std::string_view name) noexcept;
  [[nodiscard]] const OutfitRule* get(std::string_view name) const noexcept;

  // Return false when the name is unknown.
  bool enable(std::string_view name) noexcept;
  bool disable(std::string_view name) noexcept;

  // Applies the provided overrides. Returns false and changes nothing when the
  // name is unknown or the weight is not positive.
  bool configure(std::string_view name, std::optional<double> weight,
                 std::optional<bool> enabled);

  [[nodiscard]] std::vector<const OutfitRule*> get_enabled() const;
  [[nodiscard]] std::vector<const OutfitRule*> all() const;

  [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

 private:
  std::vector<std::unique_ptr<OutfitRule>> rules_;
};

// three_color, light_top_dark_bottom, forbidden_color_combo, style_coordination,
// context_appropriate, at their default weights, all enabled.
[[nodiscard]] RuleLibrary make_default_rule_library();

}  // namespace osim::rules
