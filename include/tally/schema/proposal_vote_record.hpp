#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: proposal vote record.
// Indexer workflow: One validator's commit signature on a height that created
// or settled a proposal. At most one per (height, voter_index).
namespace tally::schema {

template <uint16_t Version>
struct proposal_vote_record;

template <>
struct proposal_vote_record<1> final {
  uint16_t version{1};
  record_id_t id{};
  proposal_index_t proposal{};
  validator_index_t voter_index{};
  std::string voter_address;
  height_t height{};
  uint64_t vote{};
};

using proposal_vote_record_t = proposal_vote_record<1>;

}  // namespace tally::schema
