#pragma once

#include <tally/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: record keys.
// Indexer workflow: Canonical key prefixes and key codecs for the indexed
// replica: primary rows, secondary indexes, id sequences and system keys.
namespace tally::schema::key {

inline constexpr std::string_view kIndexProgressKey{"SYS|APP|INDEX_PROGRESS"};
inline constexpr std::string_view kSchemaVersionKey{"SYS|APP|SCHEMA_VERSION"};
inline constexpr std::string_view kSequencePrefix{"SYS|SEQ|"};

inline constexpr std::string_view kValidatorPrefix{"IDX|VALIDATOR|"};
inline constexpr std::string_view kProposalPrefix{"IDX|PROPOSAL|"};
inline constexpr std::string_view kProposalByProposerPrefix{
    "IDX|PROPOSAL_BY_PROPOSER|"};
inline constexpr std::string_view kProposalByNewHeightPrefix{
    "IDX|PROPOSAL_BY_NEW_HEIGHT|"};
inline constexpr std::string_view kProposalBySettleHeightPrefix{
    "IDX|PROPOSAL_BY_SETTLE_HEIGHT|"};
inline constexpr std::string_view kGrantPrefix{"IDX|GRANT|"};
inline constexpr std::string_view kGrantByHeightPrefix{"IDX|GRANT_BY_HEIGHT|"};
inline constexpr std::string_view kDiscussionPrefix{"IDX|DISCUSSION|"};
inline constexpr std::string_view kDiscussionByProposalPrefix{
    "IDX|DISCUSSION_BY_PROPOSAL|"};
inline constexpr std::string_view kDiscussionByOriginPrefix{
    "IDX|DISCUSSION_BY_ORIGIN|"};
inline constexpr std::string_view kProposalVotePrefix{"IDX|PROPOSAL_VOTE|"};
inline constexpr std::string_view kProposalVoteByProposalPrefix{
    "IDX|PROPOSAL_VOTE_BY_PROPOSAL|"};
inline constexpr std::string_view kProposalVoteByVoterPrefix{
    "IDX|PROPOSAL_VOTE_BY_VOTER|"};
inline constexpr std::string_view kProposalVoteByHeightVoterPrefix{
    "IDX|PROPOSAL_VOTE_BY_HEIGHT_VOTER|"};
inline constexpr std::string_view kGrantVotePrefix{"IDX|GRANT_VOTE|"};
inline constexpr std::string_view kGrantVoteByAccountPrefix{
    "IDX|GRANT_VOTE_BY_ACCOUNT|"};
inline constexpr std::string_view kGrantVoteByVoterPrefix{
    "IDX|GRANT_VOTE_BY_VOTER|"};
inline constexpr std::string_view kGrantVoteByHeightVoterPrefix{
    "IDX|GRANT_VOTE_BY_HEIGHT_VOTER|"};

inline constexpr std::string_view kDiscussionSequence{"DISCUSSION"};
inline constexpr std::string_view kProposalVoteSequence{"PROPOSAL_VOTE"};
inline constexpr std::string_view kGrantVoteSequence{"GRANT_VOTE"};

/// Every key space owned by the record store, primary rows first.
inline constexpr std::array<std::string_view, 19> kRecordKeyspaces{
    kValidatorPrefix,
    kProposalPrefix,
    kGrantPrefix,
    kDiscussionPrefix,
    kProposalVotePrefix,
    kGrantVotePrefix,
    kProposalByProposerPrefix,
    kProposalByNewHeightPrefix,
    kProposalBySettleHeightPrefix,
    kGrantByHeightPrefix,
    kDiscussionByProposalPrefix,
    kDiscussionByOriginPrefix,
    kProposalVoteByProposalPrefix,
    kProposalVoteByVoterPrefix,
    kProposalVoteByHeightVoterPrefix,
    kGrantVoteByAccountPrefix,
    kGrantVoteByVoterPrefix,
    kGrantVoteByHeightVoterPrefix,
    kSequencePrefix};

bytes_t make_prefix(std::string_view prefix);

/// Primary row key: prefix + big-endian id.
bytes_t make_row_key(std::string_view prefix, uint64_t id);

/// Prefix covering every index entry of a numeric owner (proposal, height...).
bytes_t make_owner_prefix(std::string_view prefix, uint64_t owner);

/// Index entry: prefix + big-endian owner + big-endian id.
bytes_t make_owner_key(std::string_view prefix, uint64_t owner, uint64_t id);

/// Prefix covering every index entry of an address.
bytes_t make_address_prefix(std::string_view prefix, std::string_view address);

/// Index entry: prefix + sized address + big-endian id.
bytes_t make_address_key(std::string_view prefix,
                         std::string_view address,
                         uint64_t id);

bytes_t make_sequence_key(std::string_view sequence);

bytes_t make_discussion_origin_key(uint64_t height, uint32_t ordinal);

/// Id carried in the last eight bytes of an index or row key.
uint64_t trailing_id(const bytes_view_t& key);

}  // namespace tally::schema::key
