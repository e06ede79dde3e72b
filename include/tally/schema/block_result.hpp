#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Indexer workflow: Everything a committed height produced, grouped by
// transaction in chain order.
namespace tally::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  height_t height{};
  std::vector<transaction_result_t> tx_results;
};

using block_result_t = block_result<1>;

}  // namespace tally::schema
