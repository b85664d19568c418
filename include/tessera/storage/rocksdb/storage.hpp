#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tessera/common/critical.hpp>
#include <tessera/schema/encoding/scale/encoder.hpp>
#include <tessera/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace tessera::storage {

namespace detail {

using encoder_t = tessera::schema::encoding::scale_encoder_t;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tessera::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline tessera::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline bool starts_with(const ROCKSDB_NAMESPACE::Slice& key,
                        const ROCKSDB_NAMESPACE::Slice& prefix) {
  return key.starts_with(prefix);
}

/// Queue a delete for every key under prefix.
inline void delete_prefix(ROCKSDB_NAMESPACE::DB& database,
                          const ROCKSDB_NAMESPACE::Slice& prefix,
                          ROCKSDB_NAMESPACE::WriteBatch& batch) {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix);
       iterator->Valid() && starts_with(iterator->key(), prefix);
       iterator->Next()) {
    auto status = batch.Delete(iterator->key());
    if (!status.ok()) {
      spdlog::error("Failed to queue RocksDB delete: {}", status.ToString());
      tessera::common::critical("failed deleting key during prefix rewrite");
    }
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iterator failed: {}", iterator->status().ToString());
    tessera::common::critical("failed scanning prefix");
  }
}

inline void put_entries(const std::vector<key_value_entry_t>& entries,
                        ROCKSDB_NAMESPACE::WriteBatch& batch) {
  for (const auto& [key, value] : entries) {
    auto status = batch.Put(to_slice(key), to_slice(value));
    if (!status.ok()) {
      spdlog::error("Failed to queue RocksDB put: {}", status.ToString());
      tessera::common::critical("failed writing key into batch");
    }
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  std::optional<committed_state> load_committed_state() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;
  void write_block(const tessera::schema::bytes_view_t& state_prefix,
                   const block_write& block) const;

 private:
  ROCKSDB_NAMESPACE::DB& require_database() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline ROCKSDB_NAMESPACE::DB& storage<rocksdb_storage_tag>::require_database()
    const {
  if (!database) {
    tessera::common::critical("RocksDB database is not initialized");
  }
  return *database;
}

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tessera::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = require_database().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                       detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    tessera::common::critical("Failed to get value from RocksDB");
  }
  return encoder.template decode<T>(tessera::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = std::string{};
  auto status = require_database().Get(
      ROCKSDB_NAMESPACE::ReadOptions{},
      std::string{detail::kCommittedHeightKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load committed state: {}", status.ToString());
    tessera::common::critical("failed to load committed state");
  }

  auto decoded =
      detail::encoder_t{}
          .try_decode<std::tuple<int64_t, tessera::schema::hash32_t>>(
              tessera::schema::bytes_view_t{
                  reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    tessera::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tessera::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = detail::to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      require_database().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && detail::starts_with(iterator->key(), prefix_slice);
       iterator->Next()) {
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iterator failed: {}", iterator->status().ToString());
    tessera::common::critical("failed listing prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::write_block(
    const tessera::schema::bytes_view_t& state_prefix,
    const block_write& block) const {
  auto& db = require_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::delete_prefix(db, detail::to_slice(state_prefix), batch);
  detail::put_entries(block.state_rows, batch);
  detail::put_entries(block.appended_rows, batch);

  auto encoded = detail::encoder_t{}.encode(
      std::tuple{block.committed.height, block.committed.state_root});
  auto put_status =
      batch.Put(std::string{detail::kCommittedHeightKey},
                detail::to_slice(tessera::schema::bytes_view_t{encoded}));
  if (!put_status.ok()) {
    tessera::common::critical("failed writing committed state into batch");
  }

  auto options = ROCKSDB_NAMESPACE::WriteOptions{};
  options.sync = true;
  auto status = db.Write(options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit block at height {}: {}",
                  block.committed.height, status.ToString());
    tessera::common::critical("failed to commit block batch");
  }
}

}  // namespace tessera::storage
