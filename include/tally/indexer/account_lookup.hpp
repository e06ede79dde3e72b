#pragma once

#include <tally/rpc/connection.hpp>
#include <tally/schema/account.hpp>
#include <tally/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace tally::indexer {

inline constexpr std::string_view kAccountsQueryPath{"/accounts/"};

/// Decode an `/accounts/` query payload: a JSON object carrying `index` as a
/// number or decimal string and an optional `address`.
std::optional<tally::schema::account_t> parse_account(
    const tally::schema::bytes_view_t& payload);

/// Resolves a validator address to its stable account index through the
/// chain's application state.
class account_lookup final {
 public:
  explicit account_lookup(tally::rpc::connection& connection);

  /// `address` is hex as printed in commit signatures. Throws
  /// inconsistency_error when the chain knows no such account and
  /// transport_error when the chain cannot be asked.
  tally::schema::account_t resolve(std::string_view address);

 private:
  tally::rpc::connection& connection_;
};

}  // namespace tally::indexer
