#include <gtest/gtest.h>
#include <hybridwork/schema/encoding/scale/encoder.hpp>
#include <hybridwork/schema/key/engine_keys.hpp>
#include <hybridwork/testing/common.hpp>

#include <algorithm>
#include <string_view>

namespace {

using encoder_t = hybridwork::schema::encoding::encoder<
    hybridwork::schema::encoding::scale_encoder_tag>;

using hybridwork::fhe::ciphertext;
using hybridwork::testing::make_hash;

}  // namespace

TEST(encoding_types, preference_record_keeps_handles_in_field_order) {
  auto encoder = encoder_t{};
  auto record = hybridwork::schema::preference_record_t{};
  record.record_id = 9;
  record.employee = make_hash(1);
  record.days_in_office = ciphertext{make_hash(10)};
  record.team_days = ciphertext{make_hash(20)};
  record.focus_days = ciphertext{make_hash(30)};
  record.flexibility = ciphertext{make_hash(40)};
  record.submitted_at = 1234;

  auto bytes = encoder.encode(record);
  auto decoded = encoder.try_decode<hybridwork::schema::preference_record_t>(
      hybridwork::schema::bytes_view_t{bytes});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->record_id, 9u);
  EXPECT_EQ(decoded->employee, record.employee);
  EXPECT_EQ(decoded->days_in_office, record.days_in_office);
  EXPECT_EQ(decoded->team_days, record.team_days);
  EXPECT_EQ(decoded->focus_days, record.focus_days);
  EXPECT_EQ(decoded->flexibility, record.flexibility);
  EXPECT_EQ(decoded->submitted_at, 1234u);
}

TEST(encoding_types, reveal_state_keeps_pending_request) {
  auto encoder = encoder_t{};
  auto state = hybridwork::schema::reveal_state_t{
      .employee = make_hash(2),
      .status = hybridwork::schema::reveal_status_t::request_pending,
      .pending_request = make_hash(3)};

  auto bytes = encoder.encode(state);
  auto decoded = encoder.decode<hybridwork::schema::reveal_state_t>(
      hybridwork::schema::bytes_view_t{bytes});
  EXPECT_EQ(decoded.status, hybridwork::schema::reveal_status_t::request_pending);
  ASSERT_TRUE(decoded.pending_request.has_value());
  EXPECT_EQ(*decoded.pending_request, make_hash(3));
}

TEST(encoding_types, ciphertexts_are_written_as_bare_handles) {
  auto encoder = encoder_t{};
  auto schedule = hybridwork::schema::team_schedule_t{};
  schedule.team = make_hash(5);
  schedule.office_days = ciphertext{make_hash(6)};
  schedule.collab_days = ciphertext{make_hash(7)};
  schedule.overlap_score = ciphertext{make_hash(8)};
  schedule.optimized = true;
  schedule.optimized_at = 77;

  auto bytes = encoder.encode(schedule);
  // version, team, three handles, optimized flag, timestamp.
  ASSERT_EQ(bytes.size(), 2u + 32u + (3u * 32u) + 1u + 8u);
  auto office = make_hash(6);
  EXPECT_TRUE(std::equal(office.begin(), office.end(), bytes.begin() + 34));

  auto decoded = encoder.decode<hybridwork::schema::team_schedule_t>(
      hybridwork::schema::bytes_view_t{bytes});
  EXPECT_EQ(decoded.office_days, schedule.office_days);
  EXPECT_EQ(decoded.overlap_score, schedule.overlap_score);
  EXPECT_EQ(decoded.optimized_at, 77u);
}

TEST(encoding_types_death, out_of_range_reveal_status_is_fatal) {
  auto encoder = encoder_t{};
  auto state = hybridwork::schema::reveal_state_t{
      .employee = make_hash(2),
      .status = hybridwork::schema::reveal_status_t::assigned};
  auto bytes = encoder.encode(state);
  // The status byte follows the version and the employee id.
  bytes[2 + 32] = 9;

  EXPECT_DEATH(encoder.decode<hybridwork::schema::reveal_state_t>(
                   hybridwork::schema::bytes_view_t{bytes}),
               "");
}

TEST(encoding_types_death, out_of_range_reveal_target_is_fatal) {
  auto encoder = encoder_t{};
  auto request = hybridwork::schema::decryption_request_t{};
  request.request_id = make_hash(3);
  request.employee = make_hash(4);
  auto bytes = encoder.encode(request);
  // The target byte follows the version and the request id.
  bytes[2 + 32] = 0;

  EXPECT_DEATH(encoder.decode<hybridwork::schema::decryption_request_t>(
                   hybridwork::schema::bytes_view_t{bytes}),
               "");
}

TEST(encoding_types, try_decode_rejects_truncated_bytes) {
  auto encoder = encoder_t{};
  auto schedule = hybridwork::schema::team_schedule_t{};
  schedule.team = make_hash(5);
  schedule.office_days = ciphertext{make_hash(6)};
  schedule.collab_days = ciphertext{make_hash(7)};
  schedule.overlap_score = ciphertext{make_hash(8)};
  schedule.optimized = true;

  auto bytes = encoder.encode(schedule);
  bytes.resize(bytes.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<hybridwork::schema::team_schedule_t>(
                       hybridwork::schema::bytes_view_t{bytes})
                   .has_value());
}

TEST(engine_keys, history_keys_sort_by_record_id) {
  auto employee = make_hash(4);
  auto early = hybridwork::schema::key::make_history_key(employee, 2);
  auto late = hybridwork::schema::key::make_history_key(employee, 256);
  auto prefix = hybridwork::schema::key::make_history_prefix(employee);

  EXPECT_TRUE(std::ranges::lexicographical_compare(early, late));
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), early.begin()));
  EXPECT_EQ(early.size(), prefix.size() + sizeof(uint64_t));
}

TEST(engine_keys, keyspaces_do_not_prefix_each_other) {
  const auto& spaces = hybridwork::schema::key::kEngineKeyspaces;
  for (std::size_t i = 0; i < spaces.size(); ++i) {
    for (std::size_t j = 0; j < spaces.size(); ++j) {
      if (i != j) {
        EXPECT_FALSE(spaces[j].starts_with(spaces[i]))
            << spaces[i] << " prefixes " << spaces[j];
      }
    }
  }
}
