#include <mosaic/schema/encoding/scale/encoder.hpp>
#include <mosaic/storage/rocksdb/storage.hpp>
#include <mosaic/storage/storage.hpp>
#include <mosaic/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t = mosaic::storage::storage<mosaic::storage::rocksdb_storage_tag>;
using encoder_t = mosaic::schema::encoding::scale_encoder_t;

mosaic::schema::bytes_t bytes(const std::string& value) {
  return mosaic::schema::make_bytes(value);
}

}  // namespace

TEST(storage, missing_committed_state_is_empty) {
  auto db = mosaic::testing::make_db_path("mosaic_storage_empty");
  {
    auto storage =
        mosaic::storage::make_storage<mosaic::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
  }
  mosaic::testing::remove_path(db);
}

TEST(storage, committed_state_round_trips) {
  auto db = mosaic::testing::make_db_path("mosaic_storage_committed");
  {
    auto storage =
        mosaic::storage::make_storage<mosaic::storage::rocksdb_storage_tag>(db);
    auto state = mosaic::storage::committed_state{
        .height = 42, .state_root = mosaic::testing::make_hash(10)};
    storage.save_committed_state(state);

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->height, state.height);
    EXPECT_EQ(loaded->state_root, state.state_root);
  }
  mosaic::testing::remove_path(db);
}

TEST(storage, typed_get_and_put) {
  auto db = mosaic::testing::make_db_path("mosaic_storage_typed");
  {
    auto encoder = encoder_t{};
    auto storage =
        mosaic::storage::make_storage<mosaic::storage::rocksdb_storage_tag>(db);
    auto key = bytes("k");
    EXPECT_FALSE((storage.get<encoder_t, uint64_t>(
                      encoder, mosaic::schema::make_bytes_view(key)))
                     .has_value());
    storage.put(encoder, mosaic::schema::make_bytes_view(key), uint64_t{77});
    auto value = storage.get<encoder_t, uint64_t>(
        encoder, mosaic::schema::make_bytes_view(key));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 77u);
  }
  mosaic::testing::remove_path(db);
}

TEST(storage, replace_by_prefix_drops_stale_rows_only_under_prefix) {
  auto db = mosaic::testing::make_db_path("mosaic_storage_prefix");
  {
    auto storage =
        mosaic::storage::make_storage<mosaic::storage::rocksdb_storage_tag>(db);
    auto a = bytes("A|");
    auto b = bytes("B|");
    storage.replace_by_prefix(mosaic::schema::make_bytes_view(a),
                              {{bytes("A|1"), bytes("one")},
                               {bytes("A|2"), bytes("two")}});
    storage.replace_by_prefix(mosaic::schema::make_bytes_view(b),
                              {{bytes("B|1"), bytes("bee")}});

    storage.replace_by_prefix(mosaic::schema::make_bytes_view(a),
                              {{bytes("A|3"), bytes("three")}});
    auto rows = storage.list_by_prefix(mosaic::schema::make_bytes_view(a));
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].first, bytes("A|3"));
    EXPECT_EQ(storage.list_by_prefix(mosaic::schema::make_bytes_view(b)).size(),
              1u);
  }
  mosaic::testing::remove_path(db);
}

TEST(storage, replace_by_prefixes_writes_rows_and_checkpoint_together) {
  auto db = mosaic::testing::make_db_path("mosaic_storage_batch");
  {
    auto storage =
        mosaic::storage::make_storage<mosaic::storage::rocksdb_storage_tag>(db);
    storage.replace_by_prefixes(
        {mosaic::storage::prefix_replacement_t{
             .prefix = bytes("A|"),
             .entries = {{bytes("A|1"), bytes("x")}}},
         mosaic::storage::prefix_replacement_t{
             .prefix = bytes("B|"), .entries = {}}},
        mosaic::storage::committed_state{
            .height = 3, .state_root = mosaic::testing::make_hash(3)});

    EXPECT_EQ(storage.list_by_prefix(mosaic::schema::make_bytes_view(
                                         bytes("A|")))
                  .size(),
              1u);
    EXPECT_TRUE(storage.list_by_prefix(mosaic::schema::make_bytes_view(
                                           bytes("B|")))
                    .empty());
    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 3);
  }
  mosaic::testing::remove_path(db);
}
