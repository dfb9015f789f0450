#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace osim::garment {

// Garment classes produced by the style classifier, in class-index order.
inline constexpr std::array<std::string_view, 8> kGarmentLabels = {
    "t-shirt", "shirt", "hoodie", "coat", "jeans", "casual-pants", "sneakers", "leather-shoes",
};

enum class StyleCategory {
  kFormal,
  kCasual,
  kUnknown,
};

[[nodiscard]] std::string_view style_category_to_string(StyleCategory category) noexcept;

// Label for a classifier output index. Throws core::InvalidClassIndex when
// index >= kGarmentLabels.size().
[[nodiscard]] std::string_view garment_label_at(std::size_t index);

// StyleTaxonomy maps garment labels onto style categories via membership sets.
// Labels outside every set are kUnknown. The default taxonomy covers the eight
// classifier labels; callers may build extended taxonomies with extra categories.
class StyleTaxonomy {
 public:
  struct Category {
    std::string name;
    std::vector<std::string> labels;
  };

  explicit StyleTaxonomy(std::vector<Category> categories);

  // Category name for a label, or "unknown".
  [[nodiscard]] std::string_view category_of(std::string_view label) const noexcept;

  [[nodiscard]] const std::vector<Category>& categories() const noexcept { return categories_; }

 private:
  std::vector<Category> categories_;
};

// formal: shirt, coat, leather-shoes. casual: t-shirt, hoodie, jeans, casual-pants, sneakers.
[[nodiscard]] const StyleTaxonomy& default_style_taxonomy();

// Category of a label under the default taxonomy.
[[nodiscard]] StyleCategory style_category_of(std::string_view label) noexcept;

}  // namespace osim::garment
