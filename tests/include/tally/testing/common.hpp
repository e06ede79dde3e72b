#pragma once

#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_event.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace tally::testing {

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = uint64_t{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(++counter));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Block-result event with attributes in the given order.
inline tally::schema::transaction_event_t make_event(
    const std::string_view type,
    std::initializer_list<std::pair<std::string_view, std::string_view>>
        attributes) {
  auto event = tally::schema::transaction_event_t{};
  event.type = std::string{type};
  for (const auto& [key, value] : attributes) {
    auto attribute = tally::schema::transaction_event_attribute_t{};
    attribute.key = std::string{key};
    attribute.value = std::string{value};
    attribute.index = true;
    event.attributes.push_back(std::move(attribute));
  }
  return event;
}

inline tally::schema::transaction_event_t make_proposal_event(
    const std::string_view proposal,
    const std::string_view proposer,
    const std::string_view proposer_address,
    const std::string_view data,
    const std::string_view status = "0") {
  return make_event("proposal", {{"proposal", proposal},
                                 {"proposer", proposer},
                                 {"proposer_address", proposer_address},
                                 {"data", data},
                                 {"status", status}});
}

inline tally::schema::transaction_event_t make_settle_event(
    const std::string_view proposal,
    const std::string_view state) {
  return make_event("settle_proposal",
                    {{"proposal", proposal}, {"state", state}});
}

inline tally::schema::transaction_event_t make_discussion_event(
    const std::string_view proposal,
    const std::string_view speaker,
    const std::string_view speaker_address,
    const std::string_view data) {
  return make_event("discussion", {{"proposal", proposal},
                                   {"speaker", speaker},
                                   {"speaker_address", speaker_address},
                                   {"data", data}});
}

inline tally::schema::transaction_event_t make_grant_event(
    const std::string_view validator,
    const std::string_view address,
    const std::string_view amount,
    const std::string_view proposer,
    const std::string_view proposer_address,
    const std::string_view grant) {
  return make_event("grant", {{"validator", validator},
                              {"address", address},
                              {"amount", amount},
                              {"proposer", proposer},
                              {"proposer_address", proposer_address},
                              {"grant", grant}});
}

}  // namespace tally::testing
