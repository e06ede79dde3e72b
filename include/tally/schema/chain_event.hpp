#pragma once

#include <tally/schema/discussion_event.hpp>
#include <tally/schema/grant_event.hpp>
#include <tally/schema/proposal_event.hpp>
#include <tally/schema/settle_proposal_event.hpp>
#include <variant>

namespace tally::schema {

using chain_event_t = std::variant<grant_event_t,
                                   discussion_event_t,
                                   proposal_event_t,
                                   settle_proposal_event_t>;

}  // namespace tally::schema
