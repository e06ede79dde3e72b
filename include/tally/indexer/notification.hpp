#pragma once

#include <tally/agent/client.hpp>
#include <tally/schema/primitives.hpp>
#include <string>
#include <variant>

namespace tally::indexer {

struct new_proposal_notice final {
  tally::schema::proposal_index_t proposal{};
  tally::schema::validator_index_t proposer{};
  std::string proposer_address;
  tally::schema::bytes_t data;
};

struct new_discussion_notice final {
  tally::schema::proposal_index_t proposal{};
  std::string speaker_address;
  tally::schema::bytes_t data;
};

/// Agent side effect queued while a height is processed and delivered once the
/// height is persisted.
using agent_notification_t =
    std::variant<new_proposal_notice, new_discussion_notice>;

/// Deliver one notification. Agent failures are logged and swallowed; returns
/// false when the agent could not be reached.
bool deliver(tally::agent::client& agent,
             const agent_notification_t& notification);

}  // namespace tally::indexer
