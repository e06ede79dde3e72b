#pragma once

#include <tally/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Indexer workflow: Event stream item emitted by a delivered transaction; the
// raw input of the event decoder.
namespace tally::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  /// Value of the first attribute named `key`.
  std::optional<std::string_view> attribute(const std::string_view key) const {
    for (const auto& entry : attributes) {
      if (entry.key == key) {
        return std::string_view{entry.value};
      }
    }
    return std::nullopt;
  }
};

using transaction_event_t = transaction_event<1>;

}  // namespace tally::schema
