#include <tally/decoding/event_decoder.hpp>
#include <tally/schema/event_type.hpp>
#include <tally/schema/primitives.hpp>

namespace tally::decoding {

namespace {

std::optional<uint64_t> number_attribute(
    const tally::schema::transaction_event_t& event,
    const std::string_view key) {
  auto value = event.attribute(key);
  if (!value) {
    return std::nullopt;
  }
  return tally::schema::try_parse_uint64(*value);
}

std::optional<bool> bool_attribute(
    const tally::schema::transaction_event_t& event,
    const std::string_view key) {
  auto value = event.attribute(key);
  if (!value) {
    return std::nullopt;
  }
  if (*value == "true") {
    return true;
  }
  if (*value == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::string> string_attribute(
    const tally::schema::transaction_event_t& event,
    const std::string_view key) {
  auto value = event.attribute(key);
  if (!value) {
    return std::nullopt;
  }
  return std::string{*value};
}

}  // namespace

std::optional<tally::schema::grant_event_t> decode_grant(
    const tally::schema::transaction_event_t& event) {
  auto validator = number_attribute(event, "validator");
  auto address = string_attribute(event, "address");
  auto amount = number_attribute(event, "amount");
  auto proposer = number_attribute(event, "proposer");
  auto proposer_address = string_attribute(event, "proposer_address");
  auto grant = bool_attribute(event, "grant");
  if (!validator || !address || !amount || !proposer || !proposer_address ||
      !grant) {
    return std::nullopt;
  }

  auto decoded = tally::schema::grant_event_t{};
  decoded.validator = *validator;
  decoded.address = std::move(*address);
  decoded.amount = *amount;
  decoded.proposer = *proposer;
  decoded.proposer_address = std::move(*proposer_address);
  decoded.grant = *grant;
  decoded.agent_url = string_attribute(event, "agent_url").value_or("");
  return decoded;
}

std::optional<tally::schema::discussion_event_t> decode_discussion(
    const tally::schema::transaction_event_t& event) {
  auto proposal = number_attribute(event, "proposal");
  auto speaker = number_attribute(event, "speaker");
  auto speaker_address = string_attribute(event, "speaker_address");
  auto data = event.attribute("data");
  if (!proposal || !speaker || !speaker_address || !data) {
    return std::nullopt;
  }

  auto decoded = tally::schema::discussion_event_t{};
  decoded.proposal = *proposal;
  decoded.speaker = *speaker;
  decoded.speaker_address = std::move(*speaker_address);
  decoded.data = tally::schema::make_bytes(*data);
  return decoded;
}

std::optional<tally::schema::proposal_event_t> decode_proposal(
    const tally::schema::transaction_event_t& event) {
  auto proposal = number_attribute(event, "proposal");
  auto proposer = number_attribute(event, "proposer");
  auto proposer_address = string_attribute(event, "proposer_address");
  auto data = event.attribute("data");
  auto status = number_attribute(event, "status");
  if (!proposal || !proposer || !proposer_address || !data || !status) {
    return std::nullopt;
  }

  auto decoded = tally::schema::proposal_event_t{};
  decoded.proposal = *proposal;
  decoded.proposer = *proposer;
  decoded.proposer_address = std::move(*proposer_address);
  decoded.data = tally::schema::make_bytes(*data);
  decoded.status = *status;
  return decoded;
}

std::optional<tally::schema::settle_proposal_event_t> decode_settle_proposal(
    const tally::schema::transaction_event_t& event) {
  auto proposal = number_attribute(event, "proposal");
  auto state = number_attribute(event, "state");
  if (!proposal || !state) {
    return std::nullopt;
  }
  auto decoded = tally::schema::settle_proposal_event_t{};
  decoded.proposal = *proposal;
  decoded.state = *state;
  return decoded;
}

std::optional<tally::schema::chain_event_t> decode_event(
    const tally::schema::transaction_event_t& event) {
  auto type = tally::schema::try_from_string<tally::schema::event_type_t>(
      event.type);
  if (!type) {
    return std::nullopt;
  }

  auto wrap = [](auto decoded) -> std::optional<tally::schema::chain_event_t> {
    if (!decoded) {
      return std::nullopt;
    }
    return tally::schema::chain_event_t{std::move(*decoded)};
  };

  switch (*type) {
    case tally::schema::event_type_t::grant:
      return wrap(decode_grant(event));
    case tally::schema::event_type_t::discussion:
      return wrap(decode_discussion(event));
    case tally::schema::event_type_t::proposal:
      return wrap(decode_proposal(event));
    case tally::schema::event_type_t::settle_proposal:
      return wrap(decode_settle_proposal(event));
  }
  return std::nullopt;
}

}  // namespace tally::decoding
