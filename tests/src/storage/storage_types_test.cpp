#include <hybridwork/storage/storage.hpp>
#include <hybridwork/storage/rocksdb/storage.hpp>
#include <hybridwork/schema/encoding/scale/encoder.hpp>
#include <hybridwork/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>

namespace {

using encoder_t = hybridwork::schema::encoding::encoder<
    hybridwork::schema::encoding::scale_encoder_tag>;

using hybridwork::testing::make_db_path;
using hybridwork::testing::remove_path;

hybridwork::schema::bytes_t make_key(const std::string_view value) {
  return hybridwork::schema::make_bytes(value);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto batch = hybridwork::storage::write_batch{};
  EXPECT_TRUE(batch.empty());
  batch.deletes.push_back(make_key("A|one"));
  EXPECT_FALSE(batch.empty());

  auto entry = hybridwork::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage_types, put_and_get_round_trip) {
  auto db = make_db_path("hybridwork_storage_put");
  {
    auto storage = hybridwork::storage::make_storage<
        hybridwork::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = make_key("A|value");

    EXPECT_FALSE(storage
                     .get<uint64_t>(encoder,
                                    hybridwork::schema::bytes_view_t{key})
                     .has_value());
    storage.put(encoder, hybridwork::schema::bytes_view_t{key}, uint64_t{42});
    auto loaded =
        storage.get<uint64_t>(encoder, hybridwork::schema::bytes_view_t{key});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42u);
  }
  remove_path(db);
}

TEST(storage_types, commit_applies_puts_and_deletes_together) {
  auto db = make_db_path("hybridwork_storage_commit");
  {
    auto storage = hybridwork::storage::make_storage<
        hybridwork::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto stale = make_key("A|stale");
    auto fresh = make_key("A|fresh");
    storage.put(encoder, hybridwork::schema::bytes_view_t{stale}, uint64_t{1});

    auto batch = hybridwork::storage::write_batch{};
    batch.deletes.push_back(stale);
    batch.puts.push_back({fresh, encoder.encode(uint64_t{2})});
    storage.commit(batch);

    EXPECT_FALSE(storage
                     .get<uint64_t>(encoder,
                                    hybridwork::schema::bytes_view_t{stale})
                     .has_value());
    auto loaded =
        storage.get<uint64_t>(encoder, hybridwork::schema::bytes_view_t{fresh});
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 2u);
  }
  remove_path(db);
}

TEST(storage_types, list_by_prefix_stays_inside_keyspace) {
  auto db = make_db_path("hybridwork_storage_prefix");
  {
    auto storage = hybridwork::storage::make_storage<
        hybridwork::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto a1 = make_key("A|one");
    auto a2 = make_key("A|two");
    auto b1 = make_key("B|one");
    storage.put(encoder, hybridwork::schema::bytes_view_t{a2}, uint64_t{2});
    storage.put(encoder, hybridwork::schema::bytes_view_t{b1}, uint64_t{9});
    storage.put(encoder, hybridwork::schema::bytes_view_t{a1}, uint64_t{1});

    auto a_prefix = make_key("A|");
    auto rows =
        storage.list_by_prefix(hybridwork::schema::bytes_view_t{a_prefix});
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, a1);
    EXPECT_EQ(rows[1].first, a2);
    auto value = encoder.try_decode<uint64_t>(
        hybridwork::schema::bytes_view_t{rows[1].second});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 2u);

    auto c_prefix = make_key("C|");
    EXPECT_TRUE(
        storage.list_by_prefix(hybridwork::schema::bytes_view_t{c_prefix})
            .empty());
  }
  remove_path(db);
}
