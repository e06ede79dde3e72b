#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tally/agent/eliza_client.hpp>
#include <tally/common/errors.hpp>

namespace tally::agent {

namespace {

using json = nlohmann::json;

json parse_object(const std::string_view body) {
  auto document = json::parse(body, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    throw tally::common::transport_error{"agent answered with non-JSON body"};
  }
  return document;
}

}  // namespace

std::vector<std::string> parse_agent_ids(const std::string_view body) {
  auto document = parse_object(body);
  auto ids = std::vector<std::string>{};
  auto agents = document.find("agents");
  if (agents == document.end() || !agents->is_array()) {
    return ids;
  }
  for (const auto& agent : *agents) {
    auto id = agent.find("id");
    if (id != agent.end() && id->is_string()) {
      ids.push_back(id->get<std::string>());
    }
  }
  return ids;
}

vote_recommendation parse_vote(const std::string_view body) {
  auto document = parse_object(body);
  auto vote = document.find("vote");
  if (vote == document.end() || !vote->is_string()) {
    throw tally::common::transport_error{"agent vote answer has no vote"};
  }
  auto recommendation = vote_recommendation{};
  recommendation.approve = vote->get<std::string>() == "yes";
  if (auto reason = document.find("reason");
      reason != document.end() && reason->is_string()) {
    recommendation.reason = reason->get<std::string>();
  }
  return recommendation;
}

eliza_client::eliza_client(const std::string_view url,
                           const std::chrono::milliseconds timeout)
    : http_{url, timeout} {
  auto ids = parse_agent_ids(http_.get("/agents"));
  if (ids.empty()) {
    throw tally::common::transport_error{"agent service lists no agents"};
  }
  agent_id_ = ids.front();
  spdlog::info("Using agent {} at {}:{}", agent_id_, http_.remote().host,
               http_.remote().port);
}

std::string eliza_client::post(const std::string_view route,
                               const std::string_view id_field,
                               const uint64_t id,
                               const std::string_view address,
                               const std::string_view text) const {
  auto body = json{{std::string{id_field}, std::to_string(id)},
                   {"validatorAddress", std::string{address}},
                   {"text", std::string{text}}};
  return http_.post_json(
      fmt::format("/{}/{}", agent_id_, route),
      body.dump(-1, ' ', false, json::error_handler_t::replace));
}

bool eliza_client::should_process_proposal(
    const tally::schema::validator_index_t,
    const tally::schema::bytes_t&) {
  return true;
}

vote_recommendation eliza_client::recommend_proposal_vote(
    const tally::schema::proposal_index_t proposal,
    const std::string_view voter_address) {
  auto recommendation = parse_vote(post("voteproposal", "proposalId", proposal,
                                        voter_address, "analyze proposal"));
  spdlog::info("Agent vote on proposal {} for {}: {} ({})", proposal,
               voter_address, recommendation.approve ? "yes" : "no",
               recommendation.reason);
  return recommendation;
}

vote_recommendation eliza_client::recommend_grant_vote(
    const tally::schema::validator_index_t validator,
    const std::string_view proposer_address,
    const uint64_t amount,
    const std::string_view statement) {
  auto recommendation = parse_vote(
      post("votegrant", "grantId", validator, proposer_address, statement));
  spdlog::info("Agent vote on grant {} (amount {}) from {}: {} ({})", validator,
               amount, proposer_address, recommendation.approve ? "yes" : "no",
               recommendation.reason);
  return recommendation;
}

std::string eliza_client::comment_proposal(
    const tally::schema::proposal_index_t proposal,
    const std::string_view speaker_address) {
  return post("newdiscussion", "proposalId", proposal, speaker_address,
              "comment");
}

void eliza_client::add_proposal(const tally::schema::proposal_index_t proposal,
                                const std::string_view proposer_address,
                                const std::string_view text) {
  post("proposal", "proposalId", proposal, proposer_address, text);
  spdlog::debug("Sent proposal {} to agent", proposal);
}

void eliza_client::add_discussion(
    const tally::schema::proposal_index_t proposal,
    const std::string_view speaker_address,
    const std::string_view text) {
  post("discussion", "proposalId", proposal, speaker_address, text);
  spdlog::debug("Sent discussion on proposal {} to agent", proposal);
}

}  // namespace tally::agent
