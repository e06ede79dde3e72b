#include <spdlog/spdlog.h>
#include <tally/common/errors.hpp>
#include <tally/indexer/notification.hpp>

namespace tally::indexer {

bool deliver(tally::agent::client& agent,
             const agent_notification_t& notification) {
  try {
    std::visit(
        overloaded{
            [&](const new_proposal_notice& notice) {
              if (!agent.should_process_proposal(notice.proposer,
                                                 notice.data)) {
                spdlog::info("Agent declined proposal {}", notice.proposal);
                return;
              }
              agent.add_proposal(notice.proposal, notice.proposer_address,
                                 tally::schema::make_string_view(notice.data));
              auto comment = agent.comment_proposal(notice.proposal,
                                                    notice.proposer_address);
              spdlog::info("Agent comment on proposal {}: {}", notice.proposal,
                           comment);
            },
            [&](const new_discussion_notice& notice) {
              agent.add_discussion(
                  notice.proposal, notice.speaker_address,
                  tally::schema::make_string_view(notice.data));
            }},
        notification);
  } catch (const tally::common::transport_error& e) {
    spdlog::warn("Agent notification failed: {}", e.what());
    return false;
  }
  return true;
}

}  // namespace tally::indexer
