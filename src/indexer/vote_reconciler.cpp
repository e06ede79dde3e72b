#include <spdlog/spdlog.h>
#include <tally/indexer/vote_reconciler.hpp>

namespace tally::indexer {

vote_reconciler::vote_reconciler(tally::rpc::connection& connection,
                                 account_lookup& accounts,
                                 tally::store::record_store& store)
    : connection_{connection}, accounts_{accounts}, store_{store} {}

reconcile_outcome vote_reconciler::reconcile(
    const tally::schema::height_t height) {
  auto outcome = reconcile_outcome{};

  auto proposal = store_.find_proposal_by_new_height(height);
  if (proposal) {
    outcome.target = reconcile_target_t::new_proposal;
  } else {
    proposal = store_.find_proposal_by_settle_height(height);
    if (proposal) {
      outcome.target = reconcile_target_t::settled_proposal;
    }
  }
  auto grant = std::optional<tally::schema::grant_record_t>{};
  if (!proposal) {
    grant = store_.find_grant_by_height(height);
    if (!grant) {
      return outcome;
    }
    outcome.target = reconcile_target_t::grant;
  }
  outcome.target_id = proposal ? proposal->id : grant->id;

  auto commit = connection_.call([&](tally::rpc::chain_client& client) {
    return client.commit(height);
  });

  for (const auto& signature : commit.signatures) {
    if (signature.validator_address.empty()) {
      ++outcome.absent;
      continue;
    }
    auto account = accounts_.resolve(signature.validator_address);

    if (proposal) {
      if (store_.has_proposal_vote(height, account.index)) {
        ++outcome.skipped;
        continue;
      }
      auto vote = tally::schema::proposal_vote_record_t{};
      vote.proposal = proposal->id;
      vote.voter_index = account.index;
      vote.voter_address = signature.validator_address;
      vote.height = height;
      vote.vote = signature.vote_code;
      store_.insert_proposal_vote(std::move(vote));
    } else {
      if (store_.has_grant_vote(height, account.index)) {
        ++outcome.skipped;
        continue;
      }
      auto vote = tally::schema::grant_vote_record_t{};
      vote.proposer_index = grant->proposer;
      vote.proposer_address = grant->proposer_address;
      vote.account_index = grant->id;
      vote.account_address = grant->address;
      vote.voter_index = account.index;
      vote.voter_address = account.address;
      vote.height = height;
      vote.vote = signature.vote_code;
      store_.insert_grant_vote(std::move(vote));
    }
    ++outcome.inserted;
  }

  spdlog::info("Reconciled {} vote(s) for {} {} at height {} ({} present)",
               outcome.inserted, to_string(outcome.target), outcome.target_id,
               height, outcome.skipped);
  return outcome;
}

}  // namespace tally::indexer
