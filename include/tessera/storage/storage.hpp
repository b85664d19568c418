#pragma once
#include <tessera/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace tessera::storage {

using key_value_entry_t =
    std::pair<tessera::schema::bytes_t, tessera::schema::bytes_t>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  tessera::schema::hash32_t state_root;
};

/// Everything one block commit writes. Applied as a single atomic batch:
/// every key under state_prefix is replaced by state_rows, appended_rows are
/// added alongside, and the checkpoint is moved to committed.
struct block_write final {
  std::vector<key_value_entry_t> state_rows;
  std::vector<key_value_entry_t> appended_rows;
  committed_state committed;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tessera::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const tessera::schema::bytes_view_t& prefix) const;

  /// Atomically apply a block commit; see block_write.
  void write_block(const tessera::schema::bytes_view_t& state_prefix,
                   const block_write& block) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tessera::storage
