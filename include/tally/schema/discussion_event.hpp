#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: discussion event.
// Indexer workflow: A validator's contribution to the discussion of a
// proposal.
namespace tally::schema {

template <uint16_t Version>
struct discussion_event;

template <>
struct discussion_event<1> final {
  uint16_t version{1};
  proposal_index_t proposal{};
  validator_index_t speaker{};
  std::string speaker_address;
  bytes_t data;
};

using discussion_event_t = discussion_event<1>;

}  // namespace tally::schema
