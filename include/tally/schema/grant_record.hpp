#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: grant record.
// Indexer workflow: Most recent grant decision per validator index.
namespace tally::schema {

template <uint16_t Version>
struct grant_record;

template <>
struct grant_record<1> final {
  uint16_t version{1};
  validator_index_t id{};
  std::string address;
  height_t height{};
  uint64_t stake{};
  validator_index_t proposer{};
  std::string proposer_address;
  bool grant{};
};

using grant_record_t = grant_record<1>;

}  // namespace tally::schema
