#include <warden/blake3/hash.hpp>
#include <warden/common/error.hpp>
#include <warden/schema/primitives.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

using warden::schema::format_amount;
using warden::schema::make_amount;
using warden::schema::parse_amount;

TEST(primitives, parse_amount_accepts_canonical_forms) {
  EXPECT_EQ(parse_amount("500.00"), warden::schema::amount_t{50000});
  EXPECT_EQ(parse_amount("250"), warden::schema::amount_t{25000});
  EXPECT_EQ(parse_amount("0.5"), warden::schema::amount_t{50});
  EXPECT_EQ(parse_amount("+7.25"), warden::schema::amount_t{725});
  EXPECT_EQ(parse_amount("-10.00"), warden::schema::amount_t{-1000});
}

TEST(primitives, parse_amount_rejects_malformed_text) {
  EXPECT_FALSE(parse_amount("").has_value());
  EXPECT_FALSE(parse_amount("-").has_value());
  EXPECT_FALSE(parse_amount(".50").has_value());
  EXPECT_FALSE(parse_amount("10.").has_value());
  EXPECT_FALSE(parse_amount("1.234").has_value());
  EXPECT_FALSE(parse_amount("12a").has_value());
  EXPECT_FALSE(parse_amount("1,000.00").has_value());
  EXPECT_FALSE(parse_amount(std::string(61, '9')).has_value());
}

TEST(primitives, make_amount_throws_invalid_input) {
  try {
    static_cast<void>(make_amount("ten"));
    FAIL() << "expected invalid_input";
  } catch (const warden::common::error& e) {
    EXPECT_EQ(e.code(), warden::common::error_code_t::invalid_input);
  }
}

TEST(primitives, format_amount_uses_two_fraction_digits) {
  EXPECT_EQ(format_amount(warden::schema::amount_t{50000}), "500.00");
  EXPECT_EQ(format_amount(warden::schema::amount_t{5}), "0.05");
  EXPECT_EQ(format_amount(warden::schema::amount_t{0}), "0.00");
  EXPECT_EQ(format_amount(warden::schema::amount_t{-1000}), "-10.00");
  EXPECT_EQ(format_amount(make_amount("123456789012345678901234567890.99")),
            "123456789012345678901234567890.99");
}

TEST(primitives, hex_round_trips_and_rejects_bad_input) {
  auto bytes = warden::schema::bytes_t{0x00, 0x01, 0xAB, 0xFF};
  auto hex = warden::schema::to_hex(bytes);
  EXPECT_EQ(hex, "0001abff");
  EXPECT_EQ(warden::schema::try_from_hex(hex), bytes);
  EXPECT_EQ(warden::schema::try_from_hex("0x0001ABFF"), bytes);
  EXPECT_FALSE(warden::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(warden::schema::try_from_hex("zz").has_value());
}

TEST(primitives, hash32_from_hex_requires_32_bytes) {
  auto zero = warden::schema::make_zero_hash();
  EXPECT_EQ(warden::schema::try_make_hash32(warden::schema::to_hex(zero)),
            zero);
  EXPECT_FALSE(warden::schema::try_make_hash32("0011").has_value());
}

TEST(blake3_hash, matches_reference_vector_for_empty_input) {
  auto digest = warden::blake3::hash(std::string_view{});
  EXPECT_EQ(warden::schema::to_hex(digest),
            "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(blake3_hash, parts_hash_like_their_concatenation) {
  auto left = warden::schema::make_bytes(std::string_view{"warden-"});
  auto right = warden::schema::make_bytes(std::string_view{"audit"});
  EXPECT_EQ(warden::blake3::hash({warden::schema::make_bytes_view(left),
                                  warden::schema::make_bytes_view(right)}),
            warden::blake3::hash(std::string_view{"warden-audit"}));
}
