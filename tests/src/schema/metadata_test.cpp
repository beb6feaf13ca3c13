#include <gtest/gtest.h>
#include <covenant/schema/template_metadata.hpp>

TEST(template_metadata, default_is_empty) {
  EXPECT_TRUE(covenant::schema::template_metadata_t{}.is_empty());
}

TEST(template_metadata, any_field_makes_it_non_empty) {
  auto labelled = covenant::schema::template_metadata_t{};
  labelled.label = "vault";
  EXPECT_FALSE(labelled.is_empty());

  auto coloured = covenant::schema::template_metadata_t{};
  coloured.color = "red";
  EXPECT_FALSE(coloured.is_empty());

  auto extended = covenant::schema::template_metadata_t{};
  extended.extra.emplace("note", covenant::schema::json_value{});
  EXPECT_FALSE(extended.is_empty());
}

TEST(template_metadata, empty_label_is_still_a_value) {
  auto metadata = covenant::schema::template_metadata_t{};
  metadata.label = "";
  EXPECT_FALSE(metadata.is_empty());
}

TEST(template_metadata, extra_equality_ignores_insertion_order) {
  auto lhs = covenant::schema::template_metadata_t{};
  lhs.extra.emplace("a", covenant::schema::json_value{int64_t{1}});
  lhs.extra.emplace("b", covenant::schema::json_value{true});

  auto rhs = covenant::schema::template_metadata_t{};
  rhs.extra.emplace("b", covenant::schema::json_value{true});
  rhs.extra.emplace("a", covenant::schema::json_value{int64_t{1}});

  EXPECT_EQ(lhs, rhs);
}

TEST(json_value, integer_and_number_are_distinct) {
  EXPECT_NE(covenant::schema::json_value{int64_t{1}},
            covenant::schema::json_value{1.0});
}
