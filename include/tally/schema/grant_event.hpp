#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: grant event.
// Indexer workflow: Admission/removal decision for a validator, emitted when
// the chain applies a grant.
namespace tally::schema {

template <uint16_t Version>
struct grant_event;

template <>
struct grant_event<1> final {
  uint16_t version{1};
  validator_index_t validator{};
  std::string address;
  uint64_t amount{};
  validator_index_t proposer{};
  std::string proposer_address;
  bool grant{};
  std::string agent_url;
};

using grant_event_t = grant_event<1>;

}  // namespace tally::schema
