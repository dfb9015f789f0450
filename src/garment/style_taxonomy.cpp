#include "osim/garment/style_taxonomy.h"

#include "osim/core/errors.h"

#include <algorithm>
#include <utility>

namespace osim::garment {

namespace {

constexpr std::string_view kFormal = "formal";
constexpr std::string_view kCasual = "casual";
constexpr std::string_view kUnknown = "unknown";

}  // namespace

std::string_view style_category_to_string(StyleCategory category) noexcept {
  switch (category) {
    case StyleCategory::kFormal:
      return kFormal;
    case StyleCategory::kCasual:
      return kCasual;
    case StyleCategory::kUnknown:
      return kUnknown;
  }
  return kUnknown;
}

std::string_view garment_label_at(std::size_t index) {
  if (index >= kGarmentLabels.size()) {
    throw core::InvalidClassIndex("garment class", index, kGarmentLabels.size());
  }
  return kGarmentLabels[index];
}

StyleTaxonomy::StyleTaxonomy(std::vector<Category> categories)
    : categories_(std::move(categories)) {}

std::string_view StyleTaxonomy::category_of(std::string_view label) const noexcept {
  for (const auto& category : categories_) {
    if (std::find(category.labels.begin(), category.labels.end(), label) !=
        category.labels.end()) {
      return category.name;
    }
  }
  return kUnknown;
}

const StyleTaxonomy& default_style_taxonomy() {
  static const StyleTaxonomy taxonomy(std::vector<StyleTaxonomy::Category>{
      {std::string(kFormal), {"shirt", "coat", "leather-shoes"}},
      {std::string(kCasual), {"t-shirt", "hoodie", "jeans", "casual-pants", "sneakers"}},
  });
  return taxonomy;
}

StyleCategory style_category_of(std::string_view label) noexcept {
  const auto name = default_style_taxonomy().category_of(label);
  if (name == kFormal) {
    return StyleCategory::kFormal;
  }
  if (name == kCasual) {
    return StyleCategory::kCasual;
  }
  return StyleCategory::kUnknown;
}

}  // namespace osim::garment
