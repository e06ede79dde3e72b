#include <spdlog/spdlog.h>
#include <tally/schema/key/record_keys.hpp>
#include <tally/store/record_store.hpp>

namespace tally::store {

namespace key = tally::schema::key;

namespace {

tally::storage::mutation erase(tally::schema::bytes_t key) {
  return tally::storage::mutation{std::move(key), std::nullopt};
}

tally::storage::mutation index_entry(tally::schema::bytes_t key) {
  return tally::storage::mutation{std::move(key), tally::schema::bytes_t{}};
}

}  // namespace

record_store::record_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

bool record_store::migrate() {
  auto lock = std::scoped_lock{write_mutex_};
  auto version = schema_version();
  if (version && *version > kSchemaVersion) {
    spdlog::error(
        "Record store was written with key-space version {}, this build "
        "supports up to {}",
        *version, kSchemaVersion);
    return false;
  }
  if (version && *version == kSchemaVersion) {
    spdlog::debug("Record store key-space version {}", *version);
    return true;
  }
  storage_.put(encoder_, tally::schema::make_bytes_view(key::kSchemaVersionKey),
               kSchemaVersion);
  spdlog::info("Stamped record store with key-space version {}",
               kSchemaVersion);
  return true;
}

std::optional<uint32_t> record_store::schema_version() const {
  return storage_.get<uint32_t>(
      encoder_, tally::schema::make_bytes_view(key::kSchemaVersionKey));
}

template <typename T>
tally::schema::bytes_t record_store::encode(const T& value) const {
  return encoder_.encode(value);
}

template <typename T>
std::optional<T> record_store::find_row(const std::string_view prefix,
                                        const uint64_t id) const {
  auto row_key = key::make_row_key(prefix, id);
  return storage_.get<T>(encoder_, tally::schema::make_bytes_view(row_key));
}

template <typename T>
std::optional<T> record_store::find_first_by_owner(
    const std::string_view index_prefix,
    const std::string_view row_prefix,
    const uint64_t owner) const {
  auto prefix = key::make_owner_prefix(index_prefix, owner);
  auto entries = storage_.list_by_prefix(
      tally::schema::make_bytes_view(prefix),
      tally::storage::scan_options{.offset = 0, .limit = 1, .reverse = false});
  if (entries.empty()) {
    return std::nullopt;
  }
  return find_row<T>(row_prefix, key::trailing_id(tally::schema::make_bytes_view(
                                     entries.front().first)));
}

template <typename T>
tally::schema::page_result<T> record_store::list_rows(
    const std::string_view row_prefix,
    const tally::schema::bytes_t& index_prefix,
    const tally::schema::page_request& request) const {
  auto result = tally::schema::page_result<T>{};
  auto prefix_view = tally::schema::make_bytes_view(index_prefix);
  result.total = storage_.count_by_prefix(prefix_view);
  if (request.page_size == 0) {
    return result;
  }

  auto options = tally::storage::scan_options{};
  options.offset =
      static_cast<std::size_t>(request.page) * request.page_size;
  options.limit = request.page_size;
  options.reverse = true;
  for (const auto& [index_key, _] :
       storage_.list_by_prefix(prefix_view, options)) {
    auto id = key::trailing_id(tally::schema::make_bytes_view(index_key));
    auto row = find_row<T>(row_prefix, id);
    if (!row) {
      spdlog::warn("Index entry points at missing row {} under '{}'", id,
                   row_prefix);
      continue;
    }
    result.items.push_back(std::move(*row));
  }
  return result;
}

uint64_t record_store::next_id(const std::string_view sequence) const {
  auto sequence_key = key::make_sequence_key(sequence);
  auto current = storage_.get<uint64_t>(
      encoder_, tally::schema::make_bytes_view(sequence_key));
  return current.value_or(0) + 1;
}

void record_store::save_validator(
    const tally::schema::validator_record_t& record) {
  auto lock = std::scoped_lock{write_mutex_};
  auto row_key = key::make_row_key(key::kValidatorPrefix, record.id);
  storage_.put(encoder_, tally::schema::make_bytes_view(row_key), record);
}

std::optional<tally::schema::validator_record_t> record_store::find_validator(
    const tally::schema::validator_index_t id) const {
  return find_row<tally::schema::validator_record_t>(key::kValidatorPrefix, id);
}

void record_store::save_grant(const tally::schema::grant_record_t& record) {
  auto lock = std::scoped_lock{write_mutex_};
  auto previous = find_grant(record.id);

  auto mutations = tally::storage::mutations_t{};
  if (previous && previous->height != record.height) {
    mutations.push_back(erase(key::make_owner_key(
        key::kGrantByHeightPrefix, previous->height, previous->id)));
  }
  mutations.push_back(
      tally::storage::mutation{key::make_row_key(key::kGrantPrefix, record.id),
                               encode(record)});
  mutations.push_back(index_entry(
      key::make_owner_key(key::kGrantByHeightPrefix, record.height, record.id)));
  storage_.apply(mutations);
}

std::optional<tally::schema::grant_record_t> record_store::find_grant(
    const tally::schema::validator_index_t id) const {
  return find_row<tally::schema::grant_record_t>(key::kGrantPrefix, id);
}

std::optional<tally::schema::grant_record_t> record_store::find_grant_by_height(
    const tally::schema::height_t height) const {
  return find_first_by_owner<tally::schema::grant_record_t>(
      key::kGrantByHeightPrefix, key::kGrantPrefix, height);
}

void record_store::write_proposal(
    const tally::schema::proposal_record_t& record,
    const std::optional<tally::schema::proposal_record_t>& previous) {
  auto mutations = tally::storage::mutations_t{};
  if (previous) {
    if (previous->proposer_address != record.proposer_address) {
      mutations.push_back(erase(key::make_address_key(
          key::kProposalByProposerPrefix, previous->proposer_address,
          previous->id)));
    }
    if (previous->new_height != record.new_height) {
      mutations.push_back(erase(key::make_owner_key(
          key::kProposalByNewHeightPrefix, previous->new_height,
          previous->id)));
    }
    if (previous->settle_height != 0 &&
        previous->settle_height != record.settle_height) {
      mutations.push_back(erase(key::make_owner_key(
          key::kProposalBySettleHeightPrefix, previous->settle_height,
          previous->id)));
    }
  }

  mutations.push_back(tally::storage::mutation{
      key::make_row_key(key::kProposalPrefix, record.id), encode(record)});
  mutations.push_back(index_entry(key::make_address_key(
      key::kProposalByProposerPrefix, record.proposer_address, record.id)));
  mutations.push_back(index_entry(key::make_owner_key(
      key::kProposalByNewHeightPrefix, record.new_height, record.id)));
  if (record.settle_height != 0) {
    mutations.push_back(index_entry(key::make_owner_key(
        key::kProposalBySettleHeightPrefix, record.settle_height, record.id)));
  }
  storage_.apply(mutations);
}

tally::schema::proposal_record_t record_store::save_proposal(
    const tally::schema::proposal_record_t& record) {
  auto lock = std::scoped_lock{write_mutex_};
  auto previous = find_proposal(record.id);
  auto stored = record;
  if (previous && previous->settle_height != 0) {
    stored.settle_height = previous->settle_height;
    stored.status = previous->status;
  }
  write_proposal(stored, previous);
  return stored;
}

void record_store::update_proposal(
    const tally::schema::proposal_record_t& record) {
  auto lock = std::scoped_lock{write_mutex_};
  write_proposal(record, find_proposal(record.id));
}

std::optional<tally::schema::proposal_record_t> record_store::find_proposal(
    const tally::schema::proposal_index_t id) const {
  return find_row<tally::schema::proposal_record_t>(key::kProposalPrefix, id);
}

std::optional<tally::schema::proposal_record_t>
record_store::find_proposal_by_new_height(
    const tally::schema::height_t height) const {
  return find_first_by_owner<tally::schema::proposal_record_t>(
      key::kProposalByNewHeightPrefix, key::kProposalPrefix, height);
}

std::optional<tally::schema::proposal_record_t>
record_store::find_proposal_by_settle_height(
    const tally::schema::height_t height) const {
  if (height == 0) {
    return std::nullopt;
  }
  return find_first_by_owner<tally::schema::proposal_record_t>(
      key::kProposalBySettleHeightPrefix, key::kProposalPrefix, height);
}

append_result record_store::append_discussion(
    tally::schema::discussion_record_t record) {
  auto lock = std::scoped_lock{write_mutex_};
  auto origin_key =
      key::make_discussion_origin_key(record.height, record.ordinal);
  auto existing = storage_.get<uint64_t>(
      encoder_, tally::schema::make_bytes_view(origin_key));
  if (existing) {
    return append_result{*existing, false};
  }

  record.id = next_id(key::kDiscussionSequence);
  auto mutations = tally::storage::mutations_t{};
  mutations.push_back(tally::storage::mutation{
      key::make_row_key(key::kDiscussionPrefix, record.id), encode(record)});
  mutations.push_back(index_entry(key::make_owner_key(
      key::kDiscussionByProposalPrefix, record.proposal, record.id)));
  mutations.push_back(tally::storage::mutation{origin_key, encode(record.id)});
  mutations.push_back(tally::storage::mutation{
      key::make_sequence_key(key::kDiscussionSequence), encode(record.id)});
  storage_.apply(mutations);
  return append_result{record.id, true};
}

std::optional<tally::schema::discussion_record_t>
record_store::find_discussion(const tally::schema::record_id_t id) const {
  return find_row<tally::schema::discussion_record_t>(key::kDiscussionPrefix,
                                                      id);
}

bool record_store::has_proposal_vote(
    const tally::schema::height_t height,
    const tally::schema::validator_index_t voter) const {
  auto vote_key =
      key::make_owner_key(key::kProposalVoteByHeightVoterPrefix, height, voter);
  return storage_.exists(tally::schema::make_bytes_view(vote_key));
}

tally::schema::record_id_t record_store::insert_proposal_vote(
    tally::schema::proposal_vote_record_t record) {
  auto lock = std::scoped_lock{write_mutex_};
  record.id = next_id(key::kProposalVoteSequence);
  auto mutations = tally::storage::mutations_t{};
  mutations.push_back(tally::storage::mutation{
      key::make_row_key(key::kProposalVotePrefix, record.id), encode(record)});
  mutations.push_back(index_entry(key::make_owner_key(
      key::kProposalVoteByProposalPrefix, record.proposal, record.id)));
  mutations.push_back(index_entry(key::make_address_key(
      key::kProposalVoteByVoterPrefix, record.voter_address, record.id)));
  mutations.push_back(tally::storage::mutation{
      key::make_owner_key(key::kProposalVoteByHeightVoterPrefix, record.height,
                          record.voter_index),
      encode(record.id)});
  mutations.push_back(tally::storage::mutation{
      key::make_sequence_key(key::kProposalVoteSequence), encode(record.id)});
  storage_.apply(mutations);
  return record.id;
}

bool record_store::has_grant_vote(
    const tally::schema::height_t height,
    const tally::schema::validator_index_t voter) const {
  auto vote_key =
      key::make_owner_key(key::kGrantVoteByHeightVoterPrefix, height, voter);
  return storage_.exists(tally::schema::make_bytes_view(vote_key));
}

tally::schema::record_id_t record_store::insert_grant_vote(
    tally::schema::grant_vote_record_t record) {
  auto lock = std::scoped_lock{write_mutex_};
  record.id = next_id(key::kGrantVoteSequence);
  auto mutations = tally::storage::mutations_t{};
  mutations.push_back(tally::storage::mutation{
      key::make_row_key(key::kGrantVotePrefix, record.id), encode(record)});
  mutations.push_back(index_entry(key::make_owner_key(
      key::kGrantVoteByAccountPrefix, record.account_index, record.id)));
  mutations.push_back(index_entry(key::make_address_key(
      key::kGrantVoteByVoterPrefix, record.voter_address, record.id)));
  mutations.push_back(tally::storage::mutation{
      key::make_owner_key(key::kGrantVoteByHeightVoterPrefix, record.height,
                          record.voter_index),
      encode(record.id)});
  mutations.push_back(tally::storage::mutation{
      key::make_sequence_key(key::kGrantVoteSequence), encode(record.id)});
  storage_.apply(mutations);
  return record.id;
}

tally::schema::page_result<tally::schema::proposal_record_t>
record_store::list_proposals(
    const tally::schema::page_request& request,
    const std::optional<std::string>& proposer_address) const {
  if (proposer_address) {
    return list_rows<tally::schema::proposal_record_t>(
        key::kProposalPrefix,
        key::make_address_prefix(key::kProposalByProposerPrefix,
                                 *proposer_address),
        request);
  }
  return list_rows<tally::schema::proposal_record_t>(
      key::kProposalPrefix, key::make_prefix(key::kProposalPrefix), request);
}

tally::schema::page_result<tally::schema::discussion_record_t>
record_store::list_discussions(
    const tally::schema::proposal_index_t proposal,
    const tally::schema::page_request& request) const {
  return list_rows<tally::schema::discussion_record_t>(
      key::kDiscussionPrefix,
      key::make_owner_prefix(key::kDiscussionByProposalPrefix, proposal),
      request);
}

tally::schema::page_result<tally::schema::grant_record_t>
record_store::list_grants(const tally::schema::page_request& request) const {
  return list_rows<tally::schema::grant_record_t>(
      key::kGrantPrefix, key::make_prefix(key::kGrantPrefix), request);
}

tally::schema::page_result<tally::schema::proposal_vote_record_t>
record_store::list_proposal_votes_by_proposal(
    const tally::schema::proposal_index_t proposal,
    const tally::schema::page_request& request) const {
  return list_rows<tally::schema::proposal_vote_record_t>(
      key::kProposalVotePrefix,
      key::make_owner_prefix(key::kProposalVoteByProposalPrefix, proposal),
      request);
}

tally::schema::page_result<tally::schema::proposal_vote_record_t>
record_store::list_proposal_votes_by_voter(
    const std::string_view voter_address,
    const tally::schema::page_request& request) const {
  return list_rows<tally::schema::proposal_vote_record_t>(
      key::kProposalVotePrefix,
      key::make_address_prefix(key::kProposalVoteByVoterPrefix, voter_address),
      request);
}

tally::schema::page_result<tally::schema::grant_vote_record_t>
record_store::list_grant_votes_by_account(
    const tally::schema::validator_index_t account,
    const tally::schema::page_request& request) const {
  return list_rows<tally::schema::grant_vote_record_t>(
      key::kGrantVotePrefix,
      key::make_owner_prefix(key::kGrantVoteByAccountPrefix, account), request);
}

tally::schema::page_result<tally::schema::grant_vote_record_t>
record_store::list_grant_votes_by_voter(
    const std::string_view voter_address,
    const tally::schema::page_request& request) const {
  return list_rows<tally::schema::grant_vote_record_t>(
      key::kGrantVotePrefix,
      key::make_address_prefix(key::kGrantVoteByVoterPrefix, voter_address),
      request);
}

uint64_t record_store::load_index_progress() const {
  return storage_.load_index_progress().value_or(0);
}

bool record_store::save_index_progress(const uint64_t height) {
  auto lock = std::scoped_lock{write_mutex_};
  auto current = load_index_progress();
  if (height < current) {
    spdlog::warn("Refusing to move index progress back from {} to {}", current,
                 height);
    return false;
  }
  storage_.save_index_progress(height);
  return true;
}

}  // namespace tally::store
