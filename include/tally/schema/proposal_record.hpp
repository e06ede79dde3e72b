#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: proposal record.
// Indexer workflow: Governance proposal from creation until settlement.
// `settle_height` stays zero until settled and never changes afterwards.
namespace tally::schema {

template <uint16_t Version>
struct proposal_record;

template <>
struct proposal_record<1> final {
  uint16_t version{1};
  proposal_index_t id{};
  validator_index_t proposer_index{};
  std::string proposer_address;
  bytes_t data;
  height_t new_height{};
  height_t settle_height{};
  uint64_t status{};
};

using proposal_record_t = proposal_record<1>;

}  // namespace tally::schema
