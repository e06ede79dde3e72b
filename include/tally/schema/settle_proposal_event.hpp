#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>

// Schema type: settle proposal event.
// Indexer workflow: Final outcome of a proposal.
namespace tally::schema {

template <uint16_t Version>
struct settle_proposal_event;

template <>
struct settle_proposal_event<1> final {
  uint16_t version{1};
  proposal_index_t proposal{};
  uint64_t state{};
};

using settle_proposal_event_t = settle_proposal_event<1>;

}  // namespace tally::schema
