#pragma once

#include <tally/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: event type.
// Indexer workflow: Tags of the governance events the chain emits in
// transaction results; anything else is outside the indexer's vocabulary.
namespace tally::schema {

enum class event_type_t : uint8_t {
  grant = 0,
  discussion = 1,
  proposal = 2,
  settle_proposal = 3
};

inline constexpr auto kEventTypeMappings =
    std::array{std::pair<std::string_view, event_type_t>{"grant",
                                                         event_type_t::grant},
               std::pair<std::string_view, event_type_t>{
                   "discussion", event_type_t::discussion},
               std::pair<std::string_view, event_type_t>{
                   "proposal", event_type_t::proposal},
               std::pair<std::string_view, event_type_t>{
                   "settle_proposal", event_type_t::settle_proposal}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

}  // namespace tally::schema
