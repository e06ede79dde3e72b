#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tally/common/errors.hpp>
#include <tally/indexer/account_lookup.hpp>

namespace tally::indexer {

std::optional<tally::schema::account_t> parse_account(
    const tally::schema::bytes_view_t& payload) {
  auto document = nlohmann::json::parse(
      tally::schema::make_string_view(payload), nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return std::nullopt;
  }

  auto account = tally::schema::account_t{};
  auto index = document.find("index");
  if (index == document.end()) {
    return std::nullopt;
  }
  if (index->is_number_unsigned()) {
    account.index = index->get<uint64_t>();
  } else if (index->is_string()) {
    auto parsed = tally::schema::try_parse_uint64(index->get<std::string>());
    if (!parsed) {
      return std::nullopt;
    }
    account.index = *parsed;
  } else {
    return std::nullopt;
  }

  if (auto address = document.find("address");
      address != document.end() && address->is_string()) {
    account.address = address->get<std::string>();
  }
  return account;
}

account_lookup::account_lookup(tally::rpc::connection& connection)
    : connection_{connection} {}

tally::schema::account_t account_lookup::resolve(
    const std::string_view address) {
  auto raw = tally::schema::try_from_hex(address);
  if (!raw || raw->empty()) {
    throw tally::common::inconsistency_error{
        fmt::format("commit signer address '{}' is not hex", address)};
  }

  auto result = connection_.call([&](tally::rpc::chain_client& client) {
    return client.abci_query(kAccountsQueryPath,
                             tally::schema::make_bytes_view(*raw));
  });
  if (result.code != 0) {
    throw tally::common::inconsistency_error{
        fmt::format("account query for {} failed with code {}: {}", address,
                    result.code, result.log)};
  }
  if (result.value.empty()) {
    throw tally::common::inconsistency_error{
        fmt::format("no account for commit signer {}", address)};
  }

  auto account =
      parse_account(tally::schema::make_bytes_view(result.value));
  if (!account) {
    throw tally::common::inconsistency_error{
        fmt::format("undecodable account payload for {}", address)};
  }
  if (account->address.empty()) {
    account->address = tally::schema::to_upper_hex(
        tally::schema::make_bytes_view(*raw));
  }
  spdlog::trace("Resolved {} to account {}", address, account->index);
  return *account;
}

}  // namespace tally::indexer
