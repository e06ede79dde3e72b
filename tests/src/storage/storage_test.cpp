#include <gtest/gtest.h>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <tally/storage/storage.hpp>
#include <tally/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace {

using storage_t = tally::storage::storage<tally::storage::rocksdb_storage_tag>;
using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

tally::schema::bytes_t key(const std::string_view text) {
  return tally::schema::make_bytes(text);
}

}  // namespace

TEST(storage, index_progress_round_trips) {
  auto db = tally::testing::make_db_path("tally_storage_progress");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_index_progress().has_value());
    storage.save_index_progress(42);
    auto loaded = storage.load_index_progress();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, 42u);
  }
  tally::testing::remove_path(db);
}

TEST(storage, apply_writes_and_erases_in_one_batch) {
  auto db = tally::testing::make_db_path("tally_storage_apply");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto stale = key("A|stale");
    storage.put(encoder, tally::schema::make_bytes_view(stale), uint64_t{1});

    auto mutations = tally::storage::mutations_t{};
    mutations.push_back({key("A|one"), encoder.encode(uint64_t{7})});
    mutations.push_back({key("A|marker"), tally::schema::bytes_t{}});
    mutations.push_back({stale, std::nullopt});
    storage.apply(mutations);

    EXPECT_FALSE(storage.exists(tally::schema::make_bytes_view(stale)));
    EXPECT_TRUE(storage.exists(tally::schema::make_bytes_view(key("A|marker"))));
    auto one = storage.get<uint64_t>(encoder,
                                     tally::schema::make_bytes_view(key("A|one")));
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(*one, 7u);
  }
  tally::testing::remove_path(db);
}

TEST(storage, prefix_scans_window_in_both_directions) {
  auto db = tally::testing::make_db_path("tally_storage_scan");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    for (const auto* name : {"A|1", "A|2", "A|3", "A|4", "B|1", "@|0"}) {
      storage.put(encoder,
                  tally::schema::make_bytes_view(key(name)), uint64_t{1});
    }
    auto prefix = key("A|");
    auto view = tally::schema::make_bytes_view(prefix);

    EXPECT_EQ(storage.count_by_prefix(view), 4u);

    auto forward = storage.list_by_prefix(view);
    ASSERT_EQ(forward.size(), 4u);
    EXPECT_EQ(forward.front().first, key("A|1"));

    auto reverse = storage.list_by_prefix(
        view, tally::storage::scan_options{.offset = 1, .limit = 2,
                                           .reverse = true});
    ASSERT_EQ(reverse.size(), 2u);
    EXPECT_EQ(reverse[0].first, key("A|3"));
    EXPECT_EQ(reverse[1].first, key("A|2"));

    auto past_end = storage.list_by_prefix(
        view, tally::storage::scan_options{.offset = 9, .limit = 2,
                                           .reverse = true});
    EXPECT_TRUE(past_end.empty());

    auto empty = key("C|");
    EXPECT_TRUE(
        storage.list_by_prefix(tally::schema::make_bytes_view(empty)).empty());
  }
  tally::testing::remove_path(db);
}

TEST(storage, reverse_scan_handles_last_keyspace) {
  auto db = tally::testing::make_db_path("tally_storage_last");
  {
    auto storage =
        tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    storage.put(encoder, tally::schema::make_bytes_view(key("Z|1")),
                uint64_t{1});
    storage.put(encoder, tally::schema::make_bytes_view(key("Z|2")),
                uint64_t{2});
    auto prefix = key("Z|");
    auto rows = storage.list_by_prefix(
        tally::schema::make_bytes_view(prefix),
        tally::storage::scan_options{.reverse = true});
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].first, key("Z|2"));
  }
  tally::testing::remove_path(db);
}
