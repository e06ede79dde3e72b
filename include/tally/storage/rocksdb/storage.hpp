#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <tally/common/critical.hpp>
#include <tally/common/errors.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/key/record_keys.hpp>
#include <tally/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace tally::storage {

namespace detail {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;

inline tally::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const tally::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

/// Smallest key greater than every key starting with `prefix`, or nullopt when
/// the prefix is all 0xFF.
inline std::optional<std::string> prefix_successor(std::string prefix) {
  while (!prefix.empty()) {
    auto& last = reinterpret_cast<unsigned char&>(prefix.back());
    if (last != 0xFFu) {
      ++last;
      return prefix;
    }
    prefix.pop_back();
  }
  return std::nullopt;
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const tally::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const tally::schema::bytes_view_t& key,
           const T& value) const;

  bool exists(const tally::schema::bytes_view_t& key) const;
  void apply(const mutations_t& mutations) const;
  std::optional<uint64_t> load_index_progress() const;
  void save_index_progress(uint64_t height) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const tally::schema::bytes_view_t& prefix,
      const scan_options& options = {}) const;
  uint64_t count_by_prefix(const tally::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const tally::schema::bytes_view_t& key) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    throw tally::common::storage_error{"failed to get value from RocksDB"};
  }
  return {encoder.template decode<T>(tally::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const tally::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    throw tally::common::storage_error{"failed to put value into RocksDB"};
  }
}

inline bool storage<rocksdb_storage_tag>::exists(
    const tally::schema::bytes_view_t& key) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to look up key in RocksDB: {}", status.ToString());
    throw tally::common::storage_error{"failed to look up key in RocksDB"};
  }
  return true;
}

inline void storage<rocksdb_storage_tag>::apply(
    const mutations_t& mutations) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  if (mutations.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& entry : mutations) {
    auto status = entry.value
                      ? batch.Put(detail::to_slice(entry.key),
                                  detail::to_slice(*entry.value))
                      : batch.Delete(detail::to_slice(entry.key));
    if (!status.ok()) {
      spdlog::error("Failed to stage batch write: {}", status.ToString());
      throw tally::common::storage_error{"failed to stage batch write"};
    }
  }

  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit batch to RocksDB: {}", status.ToString());
    throw tally::common::storage_error{"failed to commit batch to RocksDB"};
  }
}

inline std::optional<uint64_t>
storage<rocksdb_storage_tag>::load_index_progress() const {
  auto encoder = detail::encoder_t{};
  return get<uint64_t>(encoder, tally::schema::make_bytes_view(
                                    tally::schema::key::kIndexProgressKey));
}

inline void storage<rocksdb_storage_tag>::save_index_progress(
    const uint64_t height) const {
  auto encoder = detail::encoder_t{};
  put(encoder,
      tally::schema::make_bytes_view(tally::schema::key::kIndexProgressKey),
      height);
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const tally::schema::bytes_view_t& prefix,
    const scan_options& options) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  if (options.limit && *options.limit == 0) {
    return entries;
  }
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  if (options.reverse) {
    auto upper = detail::prefix_successor(prefix_string);
    if (upper) {
      iterator->SeekForPrev(*upper);
      if (iterator->Valid() &&
          iterator->key() == ROCKSDB_NAMESPACE::Slice{*upper}) {
        iterator->Prev();
      }
    } else {
      iterator->SeekToLast();
    }
  } else {
    iterator->Seek(prefix_string);
  }

  auto skipped = std::size_t{0};
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    if (skipped < options.offset) {
      ++skipped;
    } else {
      entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                          detail::to_bytes(iterator->value())});
      if (options.limit && entries.size() >= *options.limit) {
        break;
      }
    }
    if (options.reverse) {
      iterator->Prev();
    } else {
      iterator->Next();
    }
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    throw tally::common::storage_error{"RocksDB iteration failed"};
  }
  return entries;
}

inline uint64_t storage<rocksdb_storage_tag>::count_by_prefix(
    const tally::schema::bytes_view_t& prefix) const {
  if (!database) {
    tally::common::critical("RocksDB database is not initialized");
  }
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto count = uint64_t{0};
  for (iterator->Seek(prefix_string); iterator->Valid(); iterator->Next()) {
    if (!iterator->key().starts_with(prefix_string)) {
      break;
    }
    ++count;
  }
  if (!iterator->status().ok()) {
    throw tally::common::storage_error{"RocksDB iteration failed"};
  }
  return count;
}

}  // namespace tally::storage
