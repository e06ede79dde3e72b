#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: grant vote record.
// Indexer workflow: One validator's commit signature on a height that applied
// a grant. At most one per (height, voter_index).
namespace tally::schema {

template <uint16_t Version>
struct grant_vote_record;

template <>
struct grant_vote_record<1> final {
  uint16_t version{1};
  record_id_t id{};
  validator_index_t proposer_index{};
  std::string proposer_address;
  validator_index_t account_index{};
  std::string account_address;
  validator_index_t voter_index{};
  std::string voter_address;
  height_t height{};
  uint64_t vote{};
};

using grant_vote_record_t = grant_vote_record<1>;

}  // namespace tally::schema
