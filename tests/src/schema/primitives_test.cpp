#include <gtest/gtest.h>
#include <hybridwork/schema/error_code.hpp>
#include <hybridwork/schema/primitives.hpp>
#include <hybridwork/schema/reveal_status.hpp>
#include <hybridwork/schema/schedule_event.hpp>
#include <hybridwork/execution/optimizer.hpp>

TEST(primitives, try_make_hash32_decodes_hex_ids) {
  auto decoded = hybridwork::schema::try_make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  ASSERT_TRUE(decoded.has_value());
  const auto& hash = *decoded;
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
  EXPECT_EQ(hybridwork::schema::short_id(hash), "01020304");
}

TEST(primitives, try_make_hash32_rejects_bad_input) {
  EXPECT_FALSE(hybridwork::schema::try_make_hash32("0x0102").has_value());
  EXPECT_FALSE(hybridwork::schema::try_make_hash32(
                   std::string(64, 'z'))
                   .has_value());
}

TEST(primitives, zero_hash_is_detected) {
  auto zero = hybridwork::schema::make_zero_hash();
  EXPECT_TRUE(hybridwork::schema::is_zero_hash(zero));
  zero[31] = 1;
  EXPECT_FALSE(hybridwork::schema::is_zero_hash(zero));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = hybridwork::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded =
      hybridwork::schema::to_hex(hybridwork::schema::bytes_view_t{payload});
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(hybridwork::schema::try_from_hex(encoded), payload);
  EXPECT_FALSE(hybridwork::schema::try_from_hex("abc").has_value());
}

TEST(enum_names, reveal_status_names_are_stable) {
  using hybridwork::schema::reveal_status_t;
  EXPECT_EQ(hybridwork::schema::to_string(reveal_status_t::request_pending),
            "request_pending");
  EXPECT_EQ(hybridwork::schema::try_from_string<reveal_status_t>("revealed"),
            reveal_status_t::revealed);
  EXPECT_FALSE(hybridwork::schema::try_from_string<reveal_status_t>("done")
                   .has_value());
}

TEST(enum_names, error_category_names_come_from_the_table) {
  using hybridwork::schema::error_category;
  for (const auto& [name, value] : hybridwork::schema::kErrorCategoryMappings) {
    EXPECT_EQ(hybridwork::schema::to_string(value), name);
    EXPECT_EQ(hybridwork::schema::try_from_string<error_category>(name), value);
  }
  EXPECT_EQ(hybridwork::schema::to_string(error_category::protocol_failed),
            "protocol_failed");
  EXPECT_EQ(hybridwork::schema::to_string(static_cast<error_category>(9)),
            "unknown");
  EXPECT_FALSE(hybridwork::schema::try_from_string<error_category>("failed")
                   .has_value());
}

TEST(enum_names, event_and_adjacency_names_parse) {
  EXPECT_EQ(hybridwork::schema::to_string(
                hybridwork::schema::event_type_t::assigned),
            "assigned");
  EXPECT_EQ(hybridwork::execution::overlap_adjacency_from_string(
                "submission_order"),
            hybridwork::execution::overlap_adjacency::submission_order);
  EXPECT_FALSE(
      hybridwork::execution::overlap_adjacency_from_string("random").has_value());
}
