#include <gtest/gtest.h>
#include <covenant/schema/primitives.hpp>
#include <covenant/schema/template_error_code.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = covenant::schema::bytes_t(32, 0xAB);
  auto hash = covenant::schema::make_hash32(
      covenant::schema::make_bytes_view(input));
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = covenant::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  EXPECT_FALSE(covenant::schema::try_make_hash32("0102").has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = covenant::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = covenant::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = covenant::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(covenant::schema::from_hex(encoded), payload);
  EXPECT_EQ(covenant::schema::from_hex("0xFEFF"),
            (covenant::schema::bytes_t{0xFE, 0xFF}));
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(covenant::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(covenant::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_parse_amount_accepts_money_range_only) {
  EXPECT_EQ(covenant::schema::try_parse_amount("0"), 0);
  EXPECT_EQ(covenant::schema::try_parse_amount("2100000000000000"),
            covenant::schema::kMaxMoney);
  EXPECT_FALSE(covenant::schema::try_parse_amount("2100000000000001"));
  EXPECT_FALSE(covenant::schema::try_parse_amount("-1"));
  EXPECT_FALSE(covenant::schema::try_parse_amount("1.5"));
  EXPECT_FALSE(covenant::schema::try_parse_amount(""));
}

TEST(primitives, template_error_code_names_round_trip) {
  using covenant::schema::template_error_code;
  EXPECT_EQ(covenant::schema::to_string(template_error_code::amount_exceeded),
            "amount_exceeded");
  EXPECT_EQ(covenant::schema::try_from_string<template_error_code>(
                "missing_child"),
            template_error_code::missing_child);
  EXPECT_FALSE(covenant::schema::try_from_string<template_error_code>("nope"));
}
