#pragma once

#include <tally/schema/commit_signature.hpp>
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: commit.
// Indexer workflow: Finalized agreement on a block, one signature per
// validator in validator-set order.
namespace tally::schema {

template <uint16_t Version>
struct commit;

template <>
struct commit<1> final {
  uint16_t version{1};
  height_t height{};
  std::vector<commit_signature_t> signatures;
};

using commit_t = commit<1>;

}  // namespace tally::schema
