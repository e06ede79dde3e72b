#pragma once

#include <tally/schema/discussion_record.hpp>
#include <tally/schema/encoding/encoder.hpp>
#include <tally/schema/encoding/scale/encoder.hpp>
#include <tally/schema/grant_record.hpp>
#include <tally/schema/grant_vote_record.hpp>
#include <tally/schema/page.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/proposal_record.hpp>
#include <tally/schema/proposal_vote_record.hpp>
#include <tally/schema/validator_record.hpp>
#include <tally/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tally::store {

using encoder_t = tally::schema::encoding::encoder<
    tally::schema::encoding::scale_encoder_tag>;
using storage_t = tally::storage::storage<tally::storage::rocksdb_storage_tag>;

/// Outcome of appending a row that is deduplicated by its origin.
struct append_result final {
  tally::schema::record_id_t id{};
  bool inserted{};
};

/// Typed access to the indexed replica.
///
/// Every write that touches more than one key (a row plus its secondary
/// indexes, or an id sequence) is committed as one RocksDB batch, so a crash
/// never leaves a row without its index entries. Reads are safe from any
/// thread; writes are expected from the sync worker only.
class record_store final {
 public:
  static constexpr uint32_t kSchemaVersion{1};

  explicit record_store(encoder_t& encoder, storage_t& storage);

  /// Stamp an empty database with the current key-space version, or check an
  /// existing stamp. Returns false when the database was written by a newer
  /// binary.
  bool migrate();

  std::optional<uint32_t> schema_version() const;

  void save_validator(const tally::schema::validator_record_t& record);
  std::optional<tally::schema::validator_record_t> find_validator(
      tally::schema::validator_index_t id) const;

  /// Create or overwrite the grant of `record.id`.
  void save_grant(const tally::schema::grant_record_t& record);
  std::optional<tally::schema::grant_record_t> find_grant(
      tally::schema::validator_index_t id) const;
  std::optional<tally::schema::grant_record_t> find_grant_by_height(
      tally::schema::height_t height) const;

  /// Write a newly created proposal. Settlement already recorded for the same
  /// id is carried over. Returns the row as stored.
  tally::schema::proposal_record_t save_proposal(
      const tally::schema::proposal_record_t& record);

  /// Overwrite every field of an existing proposal.
  void update_proposal(const tally::schema::proposal_record_t& record);

  std::optional<tally::schema::proposal_record_t> find_proposal(
      tally::schema::proposal_index_t id) const;
  std::optional<tally::schema::proposal_record_t> find_proposal_by_new_height(
      tally::schema::height_t height) const;
  std::optional<tally::schema::proposal_record_t>
  find_proposal_by_settle_height(tally::schema::height_t height) const;

  /// Append a discussion unless one with the same (height, ordinal) origin is
  /// already stored. The id of `record` is ignored and assigned here.
  append_result append_discussion(tally::schema::discussion_record_t record);
  std::optional<tally::schema::discussion_record_t> find_discussion(
      tally::schema::record_id_t id) const;

  bool has_proposal_vote(tally::schema::height_t height,
                         tally::schema::validator_index_t voter) const;
  tally::schema::record_id_t insert_proposal_vote(
      tally::schema::proposal_vote_record_t record);

  bool has_grant_vote(tally::schema::height_t height,
                      tally::schema::validator_index_t voter) const;
  tally::schema::record_id_t insert_grant_vote(
      tally::schema::grant_vote_record_t record);

  tally::schema::page_result<tally::schema::proposal_record_t> list_proposals(
      const tally::schema::page_request& request,
      const std::optional<std::string>& proposer_address = std::nullopt) const;
  tally::schema::page_result<tally::schema::discussion_record_t>
  list_discussions(tally::schema::proposal_index_t proposal,
                   const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::grant_record_t> list_grants(
      const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::proposal_vote_record_t>
  list_proposal_votes_by_proposal(
      tally::schema::proposal_index_t proposal,
      const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::proposal_vote_record_t>
  list_proposal_votes_by_voter(
      std::string_view voter_address,
      const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::grant_vote_record_t>
  list_grant_votes_by_account(
      tally::schema::validator_index_t account,
      const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::grant_vote_record_t>
  list_grant_votes_by_voter(
      std::string_view voter_address,
      const tally::schema::page_request& request) const;

  /// Last fully indexed height, zero before the first height.
  uint64_t load_index_progress() const;

  /// Persist `height` as the last fully indexed height. A height lower than
  /// the stored one is refused and reported with false.
  bool save_index_progress(uint64_t height);

 private:
  template <typename T>
  std::optional<T> find_row(std::string_view prefix, uint64_t id) const;

  template <typename T>
  tally::schema::page_result<T> list_rows(
      std::string_view row_prefix,
      const tally::schema::bytes_t& index_prefix,
      const tally::schema::page_request& request) const;

  template <typename T>
  std::optional<T> find_first_by_owner(std::string_view index_prefix,
                                       std::string_view row_prefix,
                                       uint64_t owner) const;

  uint64_t next_id(std::string_view sequence) const;

  void write_proposal(
      const tally::schema::proposal_record_t& record,
      const std::optional<tally::schema::proposal_record_t>& previous);

  template <typename T>
  tally::schema::bytes_t encode(const T& value) const;

  mutable std::mutex write_mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace tally::store
