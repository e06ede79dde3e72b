#include <spdlog/spdlog.h>
#include <tally/common/errors.hpp>
#include <tally/decoding/event_decoder.hpp>
#include <tally/indexer/dispatcher.hpp>
#include <utility>
#include <variant>

namespace tally::indexer {

template <typename Event>
void dispatcher::route(const tally::schema::event_type_t type,
                       void (dispatcher::*handler)(Event,
                                                   tally::schema::height_t,
                                                   uint32_t)) {
  handlers_.emplace(
      tally::schema::to_string(type),
      [this, type, handler](tally::schema::chain_event_t& event,
                            const tally::schema::height_t height,
                            const uint32_t ordinal) {
        auto* typed = std::get_if<Event>(&event);
        if (typed == nullptr) {
          spdlog::error("Event routed as '{}' at height {} decoded as another "
                        "type, dropping it",
                        tally::schema::to_string(type), height);
          return;
        }
        (this->*handler)(std::move(*typed), height, ordinal);
      });
}

dispatcher::dispatcher(tally::store::record_store& store) : store_{store} {
  using tally::schema::event_type_t;

  route(event_type_t::grant, &dispatcher::on_grant);
  route(event_type_t::discussion, &dispatcher::on_discussion);
  route(event_type_t::proposal, &dispatcher::on_proposal);
  route(event_type_t::settle_proposal, &dispatcher::on_settle_proposal);
}

bool dispatcher::dispatch(const std::string_view type,
                          const tally::schema::transaction_event_t& event,
                          const tally::schema::height_t height,
                          const uint32_t ordinal) {
  auto handler = handlers_.find(type);
  if (handler == handlers_.end()) {
    return false;
  }

  auto decoded = tally::decoding::decode_event(event);
  if (!decoded) {
    spdlog::error("Dropping undecodable {} event at height {}", type, height);
    return true;
  }

  try {
    handler->second(*decoded, height, ordinal);
  } catch (const tally::common::storage_error& e) {
    spdlog::error("Failed to store '{}' event at height {}: {}", type, height,
                  e.what());
  }
  return true;
}

std::vector<agent_notification_t> dispatcher::drain() {
  auto drained = std::vector<agent_notification_t>{};
  drained.swap(pending_);
  return drained;
}

void dispatcher::discard_pending() {
  if (!pending_.empty()) {
    spdlog::debug("Discarding {} undelivered agent notification(s)",
                  pending_.size());
  }
  pending_.clear();
}

void dispatcher::on_grant(tally::schema::grant_event_t event,
                          const tally::schema::height_t height,
                          uint32_t) {
  auto grant = tally::schema::grant_record_t{};
  grant.id = event.validator;
  grant.address = event.address;
  grant.height = height;
  grant.stake = event.amount;
  grant.proposer = event.proposer;
  grant.proposer_address = event.proposer_address;
  grant.grant = event.grant;
  store_.save_grant(grant);

  auto validator = tally::schema::validator_record_t{};
  validator.id = event.validator;
  validator.address = std::move(event.address);
  validator.agent_url = std::move(event.agent_url);
  validator.stake = event.amount;
  store_.save_validator(validator);
  spdlog::debug("Indexed grant for validator {} at height {}", grant.id,
                height);
}

void dispatcher::on_discussion(tally::schema::discussion_event_t event,
                               const tally::schema::height_t height,
                               const uint32_t ordinal) {
  auto discussion = tally::schema::discussion_record_t{};
  discussion.proposal = event.proposal;
  discussion.speaker_index = event.speaker;
  discussion.speaker_address = event.speaker_address;
  discussion.data = event.data;
  discussion.height = height;
  discussion.ordinal = ordinal;
  auto appended = store_.append_discussion(std::move(discussion));
  if (!appended.inserted) {
    spdlog::debug("Discussion at height {} ordinal {} already indexed as {}",
                  height, ordinal, appended.id);
  }

  pending_.emplace_back(new_discussion_notice{
      event.proposal, std::move(event.speaker_address), std::move(event.data)});
}

void dispatcher::on_proposal(tally::schema::proposal_event_t event,
                             const tally::schema::height_t height,
                             uint32_t) {
  auto proposal = tally::schema::proposal_record_t{};
  proposal.id = event.proposal;
  proposal.proposer_index = event.proposer;
  proposal.proposer_address = event.proposer_address;
  proposal.data = event.data;
  proposal.new_height = height;
  proposal.status = event.status;
  store_.save_proposal(proposal);
  spdlog::info("Indexed proposal {} at height {}", proposal.id, height);

  pending_.emplace_back(new_proposal_notice{
      event.proposal, event.proposer, std::move(event.proposer_address),
      std::move(event.data)});
}

void dispatcher::on_settle_proposal(tally::schema::settle_proposal_event_t event,
                                    const tally::schema::height_t height,
                                    uint32_t) {
  auto proposal = store_.find_proposal(event.proposal);
  if (!proposal) {
    spdlog::error("Settlement at height {} names unknown proposal {}, skipping",
                  height, event.proposal);
    return;
  }
  if (proposal->settle_height != 0 && proposal->settle_height != height) {
    spdlog::warn(
        "Proposal {} already settled at height {}, ignoring settlement at {}",
        proposal->id, proposal->settle_height, height);
    return;
  }

  proposal->status = event.state;
  proposal->settle_height = height;
  store_.update_proposal(*proposal);
  spdlog::info("Proposal {} settled with state {} at height {}", proposal->id,
               event.state, height);
}

}  // namespace tally::indexer
