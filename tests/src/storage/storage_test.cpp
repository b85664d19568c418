#include <gtest/gtest.h>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/schema/key/engine_keys.hpp>
#include <tessera/storage/rocksdb/storage.hpp>
#include <tessera/storage/storage.hpp>
#include <tessera/testing/common.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace tessera::testing;

namespace {

using storage_t =
    tessera::storage::storage<tessera::storage::rocksdb_storage_tag>;
using encoder_t = tessera::schema::encoding::scale_encoder_t;

storage_t open_storage(const std::string& path) {
  return tessera::storage::make_storage<tessera::storage::rocksdb_storage_tag>(
      path);
}

tessera::storage::key_value_entry_t make_entry(const std::string& key,
                                               const std::string& value) {
  return {tessera::schema::make_bytes(key), tessera::schema::make_bytes(value)};
}

tessera::storage::block_write make_block(
    std::vector<tessera::storage::key_value_entry_t> state_rows,
    std::vector<tessera::storage::key_value_entry_t> appended_rows,
    const int64_t height) {
  return tessera::storage::block_write{
      .state_rows = std::move(state_rows),
      .appended_rows = std::move(appended_rows),
      .committed = {.height = height,
                    .state_root = make_hash(static_cast<uint8_t>(height))}};
}

}  // namespace

TEST(storage, committed_state_survives_reopen) {
  auto db = make_db_path("tessera_storage_committed");
  auto state_prefix = std::string_view{"A|"};
  {
    auto store = open_storage(db);
    EXPECT_FALSE(store.load_committed_state().has_value());
    store.write_block(tessera::schema::make_bytes_view(state_prefix),
                      make_block({}, {}, 9));
  }
  {
    auto store = open_storage(db);
    auto committed = store.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 9);
    EXPECT_EQ(committed->state_root, make_hash(9));
  }
  remove_path(db);
}

TEST(storage, get_decodes_rows_written_by_a_block) {
  auto db = make_db_path("tessera_storage_get");
  {
    auto store = open_storage(db);
    auto encoder = encoder_t{};
    auto key = tessera::schema::make_bytes(std::string{"A|count"});
    EXPECT_FALSE(
        (store.get<uint64_t>(encoder, tessera::schema::make_bytes_view(key))));

    store.write_block(
        tessera::schema::make_bytes_view(std::string_view{"A|"}),
        make_block({{key, encoder.encode(uint64_t{77})}}, {}, 1));
    auto value =
        store.get<uint64_t>(encoder, tessera::schema::make_bytes_view(key));
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), 77u);
  }
  remove_path(db);
}

TEST(storage, list_by_prefix_is_ordered_and_bounded) {
  auto db = make_db_path("tessera_storage_prefix");
  {
    auto store = open_storage(db);
    store.write_block(
        tessera::schema::make_bytes_view(std::string_view{"A|"}),
        make_block({make_entry("A|2", "two"), make_entry("A|1", "one")},
                   {make_entry("B|1", "other")}, 1));

    auto rows = store.list_by_prefix(
        tessera::schema::make_bytes_view(std::string_view{"A|"}));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(tessera::schema::make_string(rows[0].first), "A|1");
    EXPECT_EQ(tessera::schema::make_string(rows[1].second), "two");

    auto other = store.list_by_prefix(
        tessera::schema::make_bytes_view(std::string_view{"B|"}));
    ASSERT_EQ(other.size(), 1u);
    EXPECT_EQ(tessera::schema::make_string(other[0].second), "other");
  }
  remove_path(db);
}

TEST(storage, write_block_replaces_state_and_appends_history) {
  auto db = make_db_path("tessera_storage_block");
  auto state_prefix =
      tessera::schema::make_bytes(tessera::schema::key::kStatePrefix);
  auto history_prefix =
      tessera::schema::make_bytes(tessera::schema::key::kHistoryPrefix);
  auto stale_key = tessera::schema::key::make_balance_key(make_account(1));
  auto kept_key = tessera::schema::key::make_balance_key(make_account(2));
  {
    auto store = open_storage(db);
    store.write_block(
        tessera::schema::make_bytes_view(state_prefix),
        tessera::storage::block_write{
            .state_rows = {{stale_key, tessera::schema::bytes_t{1}},
                           {kept_key, tessera::schema::bytes_t{2}}},
            .appended_rows = {{tessera::schema::key::make_history_key(1, 0),
                               tessera::schema::bytes_t{9}}},
            .committed = {.height = 1, .state_root = make_hash(1)}});

    store.write_block(
        tessera::schema::make_bytes_view(state_prefix),
        tessera::storage::block_write{
            .state_rows = {{kept_key, tessera::schema::bytes_t{3}}},
            .appended_rows = {{tessera::schema::key::make_history_key(2, 0),
                               tessera::schema::bytes_t{8}}},
            .committed = {.height = 2, .state_root = make_hash(2)}});
  }
  {
    auto store = open_storage(db);
    auto state = store.list_by_prefix(tessera::schema::make_bytes_view(state_prefix));
    ASSERT_EQ(state.size(), 1u);
    EXPECT_EQ(state[0].first, kept_key);
    EXPECT_EQ(state[0].second, tessera::schema::bytes_t{3});

    auto history =
        store.list_by_prefix(tessera::schema::make_bytes_view(history_prefix));
    EXPECT_EQ(history.size(), 2u);

    auto committed = store.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 2);
    EXPECT_EQ(committed->state_root, make_hash(2));
  }
  remove_path(db);
}
