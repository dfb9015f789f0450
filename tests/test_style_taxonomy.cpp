#include "osim/core/errors.h"
#include "osim/garment/style_taxonomy.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace osim;
using garment::StyleCategory;

TEST_CASE("garment labels map to classifier indices", "[garment][taxonomy]") {
  CHECK(garment::garment_label_at(0) == "t-shirt");
  CHECK(garment::garment_label_at(3) == "coat");
  CHECK(garment::garment_label_at(7) == "leather-shoes");

  SECTION("out-of-range index throws") {
    CHECK_THROWS_AS(garment::garment_label_at(8), core::InvalidClassIndex);
    try {
      (void)garment::garment_label_at(42);
      FAIL("expected InvalidClassIndex");
    } catch (const core::InvalidClassIndex& e) {
      CHECK(e.index() == 42);
    }
  }
}

TEST_CASE("default taxonomy splits formal and casual", "[garment][taxonomy]") {
  CHECK(garment::style_category_of("shirt") == StyleCategory::kFormal);
  CHECK(garment::style_category_of("coat") == StyleCategory::kFormal);
  CHECK(garment::style_category_of("leather-shoes") == StyleCategory::kFormal);
  CHECK(garment::style_category_of("hoodie") == StyleCategory::kCasual);
  CHECK(garment::style_category_of("sneakers") == StyleCategory::kCasual);
  CHECK(garment::style_category_of("scarf") == StyleCategory::kUnknown);
  CHECK(garment::style_category_of("") == StyleCategory::kUnknown);

  SECTION("every classifier label has a known category") {
    for (const auto label : garment::kGarmentLabels) {
      CHECK(garment::style_category_of(label) != StyleCategory::kUnknown);
    }
  }

  CHECK(garment::style_category_to_string(StyleCategory::kCasual) == "casual");
}

TEST_CASE("custom taxonomies resolve by membership", "[garment][taxonomy]") {
  const garment::StyleTaxonomy taxonomy(std::vector<garment::StyleTaxonomy::Category>{
      {"formal", {"shirt"}},
      {"sporty", {"track-pants", "sneakers"}},
  });

  CHECK(taxonomy.category_of("sneakers") == "sporty");
  CHECK(taxonomy.category_of("shirt") == "formal");
  CHECK(taxonomy.category_of("jeans") == "unknown");
  CHECK(taxonomy.categories().size() == 2);
}
