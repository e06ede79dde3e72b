#pragma once

#include <tally/schema/chain_event.hpp>
#include <tally/schema/discussion_event.hpp>
#include <tally/schema/grant_event.hpp>
#include <tally/schema/proposal_event.hpp>
#include <tally/schema/settle_proposal_event.hpp>
#include <tally/schema/transaction_event.hpp>
#include <optional>

// Decoders from raw block-result events to typed chain events. Each decoder
// yields either a complete event or std::nullopt, never a partial value.
namespace tally::decoding {

std::optional<tally::schema::grant_event_t> decode_grant(
    const tally::schema::transaction_event_t& event);

std::optional<tally::schema::discussion_event_t> decode_discussion(
    const tally::schema::transaction_event_t& event);

std::optional<tally::schema::proposal_event_t> decode_proposal(
    const tally::schema::transaction_event_t& event);

std::optional<tally::schema::settle_proposal_event_t> decode_settle_proposal(
    const tally::schema::transaction_event_t& event);

/// Pick the decoder from `event.type`. Unknown types decode to std::nullopt.
std::optional<tally::schema::chain_event_t> decode_event(
    const tally::schema::transaction_event_t& event);

}  // namespace tally::decoding
