#pragma once
#include <tally/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace tally::storage {

using key_value_entry_t =
    std::pair<tally::schema::bytes_t, tally::schema::bytes_t>;

/// One write of an atomic batch. An empty value erases the key.
struct mutation final {
  tally::schema::bytes_t key;
  std::optional<tally::schema::bytes_t> value;
};

using mutations_t = std::vector<mutation>;

/// Window over a prefix scan. `reverse` walks keys from the largest down.
struct scan_options final {
  std::size_t offset{};
  std::optional<std::size_t> limit;
  bool reverse{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  bool exists(const tally::schema::bytes_view_t& key) const;

  /// Apply every mutation or none of them.
  void apply(const mutations_t& mutations) const;

  /// Load the last fully indexed height.
  std::optional<uint64_t> load_index_progress() const;

  /// Persist the last fully indexed height.
  void save_index_progress(uint64_t height) const;

  /// Return the key-value pairs sharing the provided key prefix, windowed by
  /// `options`.
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix,
      const scan_options& options) const;

  uint64_t count_by_prefix(const tally::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace tally::storage
