#pragma once

#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: account.
// Indexer workflow: Validator account as held in chain state, resolved from a
// signer address during vote reconciliation.
namespace tally::schema {

template <uint16_t Version>
struct account;

template <>
struct account<1> final {
  uint16_t version{1};
  validator_index_t index{};
  /// Uppercase hex.
  std::string address;
};

using account_t = account<1>;

}  // namespace tally::schema
