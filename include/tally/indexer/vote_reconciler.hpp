#pragma once

#include <tally/indexer/account_lookup.hpp>
#include <tally/rpc/connection.hpp>
#include <tally/schema/enum_string.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/store/record_store.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace tally::indexer {

enum class reconcile_target_t : uint8_t {
  none = 0,
  new_proposal = 1,
  settled_proposal = 2,
  grant = 3
};

inline constexpr auto kReconcileTargetMappings = std::array{
    std::pair<std::string_view, reconcile_target_t>{"none",
                                                    reconcile_target_t::none},
    std::pair<std::string_view, reconcile_target_t>{
        "new_proposal", reconcile_target_t::new_proposal},
    std::pair<std::string_view, reconcile_target_t>{
        "settled_proposal", reconcile_target_t::settled_proposal},
    std::pair<std::string_view, reconcile_target_t>{
        "grant", reconcile_target_t::grant}};

inline constexpr std::string_view to_string(const reconcile_target_t value) {
  return tally::schema::to_string(value, kReconcileTargetMappings)
      .value_or("unknown");
}

struct reconcile_outcome final {
  reconcile_target_t target{reconcile_target_t::none};
  /// Proposal index or grant (validator) index the votes were recorded for.
  uint64_t target_id{};
  uint32_t inserted{};
  uint32_t skipped{};
  /// Signatures without a validator address.
  uint32_t absent{};
};

/// Turns the commit signatures of a height into vote rows.
///
/// The height is matched against, in order, a proposal created at it, a
/// proposal settled at it, and a grant recorded at it. Only the first match is
/// reconciled. Every signer must resolve to an account; one that does not
/// aborts the height with inconsistency_error, leaving the rows inserted so far
/// in place for the retry to skip.
class vote_reconciler final {
 public:
  vote_reconciler(tally::rpc::connection& connection,
                  account_lookup& accounts,
                  tally::store::record_store& store);

  reconcile_outcome reconcile(tally::schema::height_t height);

 private:
  tally::rpc::connection& connection_;
  account_lookup& accounts_;
  tally::store::record_store& store_;
};

}  // namespace tally::indexer
