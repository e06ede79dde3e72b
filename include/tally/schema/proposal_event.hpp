#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: proposal event.
// Indexer workflow: A governance proposal entering the chain.
namespace tally::schema {

template <uint16_t Version>
struct proposal_event;

template <>
struct proposal_event<1> final {
  uint16_t version{1};
  proposal_index_t proposal{};
  validator_index_t proposer{};
  std::string proposer_address;
  bytes_t data;
  uint64_t status{};
};

using proposal_event_t = proposal_event<1>;

}  // namespace tally::schema
