#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: commit signature.
// Indexer workflow: One validator's entry in a block commit; the unit of vote
// reconciliation.
namespace tally::schema {

template <uint16_t Version>
struct commit_signature;

template <>
struct commit_signature<1> final {
  uint16_t version{1};
  /// Uppercase hex, empty for absent validators.
  std::string validator_address;
  uint64_t block_id_flag{};
  uint64_t vote_code{};
};

using commit_signature_t = commit_signature<1>;

}  // namespace tally::schema
