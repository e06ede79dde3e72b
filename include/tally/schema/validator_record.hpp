#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: validator record.
// Indexer workflow: Latest known standing of a consensus participant, keyed by
// validator index.
namespace tally::schema {

template <uint16_t Version>
struct validator_record;

template <>
struct validator_record<1> final {
  uint16_t version{1};
  validator_index_t id{};
  std::string address;
  std::string agent_url;
  uint64_t stake{};
};

using validator_record_t = validator_record<1>;

}  // namespace tally::schema
