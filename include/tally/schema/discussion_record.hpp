#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: discussion record.
// Indexer workflow: Append-only discussion entry; `ordinal` is the position of
// the originating event within its height.
namespace tally::schema {

template <uint16_t Version>
struct discussion_record;

template <>
struct discussion_record<1> final {
  uint16_t version{1};
  record_id_t id{};
  proposal_index_t proposal{};
  validator_index_t speaker_index{};
  std::string speaker_address;
  bytes_t data;
  height_t height{};
  uint32_t ordinal{};
};

using discussion_record_t = discussion_record<1>;

}  // namespace tally::schema
