#pragma once

#include <tally/indexer/sync_loop.hpp>
#include <tally/schema/page.hpp>
#include <tally/store/record_store.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tally::query {

inline constexpr uint32_t kMaxPageSize{100};

struct index_status final {
  tally::schema::height_t last_indexed{};
  tally::schema::height_t head{};
  tally::schema::height_t next_height{};
  tally::indexer::sync_state_t state{tally::indexer::sync_state_t::idle};
};

/// Read-only view of the indexed replica. Every listing is ordered by id,
/// newest first, and reports the size of the whole result set.
class service final {
 public:
  /// `loop` may be null when the replica is served without a running indexer.
  explicit service(const tally::store::record_store& store,
                   const tally::indexer::sync_loop* loop = nullptr);

  /// Page size capped at kMaxPageSize.
  static tally::schema::page_request clamp(tally::schema::page_request request);

  tally::schema::page_result<tally::schema::proposal_record_t> list_proposals(
      const tally::schema::page_request& request,
      const std::optional<std::string>& proposer_address = std::nullopt) const;
  std::optional<tally::schema::proposal_record_t> get_proposal(
      tally::schema::proposal_index_t id) const;

  tally::schema::page_result<tally::schema::discussion_record_t>
  list_discussions(tally::schema::proposal_index_t proposal,
                   const tally::schema::page_request& request) const;

  tally::schema::page_result<tally::schema::grant_record_t> list_grants(
      const tally::schema::page_request& request) const;
  std::optional<tally::schema::grant_record_t> get_grant(
      tally::schema::validator_index_t id) const;

  tally::schema::page_result<tally::schema::proposal_vote_record_t>
  list_proposal_votes(tally::schema::proposal_index_t proposal,
                      const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::proposal_vote_record_t>
  list_proposal_votes_by_voter(
      std::string_view voter_address,
      const tally::schema::page_request& request) const;

  tally::schema::page_result<tally::schema::grant_vote_record_t>
  list_grant_votes(tally::schema::validator_index_t grant,
                   const tally::schema::page_request& request) const;
  tally::schema::page_result<tally::schema::grant_vote_record_t>
  list_grant_votes_by_voter(std::string_view voter_address,
                            const tally::schema::page_request& request) const;

  index_status status() const;

 private:
  const tally::store::record_store& store_;
  const tally::indexer::sync_loop* loop_;
};

}  // namespace tally::query
