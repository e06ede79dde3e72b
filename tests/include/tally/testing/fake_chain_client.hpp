#pragma once

#include <tally/common/errors.hpp>
#include <tally/indexer/account_lookup.hpp>
#include <tally/rpc/chain_client.hpp>
#include <tally/rpc/connection.hpp>
#include <tally/schema/block_result.hpp>
#include <tally/schema/commit.hpp>
#include <tally/schema/query_result.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tally::testing {

/// In-memory chain shared by every client built from it, so a rebuilt
/// connection sees the same heights.
class fake_chain final {
 public:
  void set_head(const tally::schema::height_t head) { head_ = head; }
  tally::schema::height_t head() const { return head_; }

  /// Append the events as one transaction of `height`.
  void add_transaction(
      const tally::schema::height_t height,
      std::vector<tally::schema::transaction_event_t> events) {
    auto& block = blocks_[height];
    block.height = height;
    auto tx = tally::schema::transaction_result_t{};
    tx.events = std::move(events);
    block.tx_results.push_back(std::move(tx));
  }

  /// Append a signature to the commit of `height`. An empty address is an
  /// absent validator.
  void add_signature(const tally::schema::height_t height,
                     const std::string_view address,
                     const uint64_t vote_code = 2) {
    auto& commit = commits_[height];
    commit.height = height;
    auto signature = tally::schema::commit_signature_t{};
    signature.validator_address = std::string{address};
    signature.block_id_flag = address.empty() ? 1 : 2;
    signature.vote_code = address.empty() ? 1 : vote_code;
    commit.signatures.push_back(std::move(signature));
  }

  void add_account(const std::string_view address,
                   const tally::schema::validator_index_t index) {
    accounts_[std::string{address}] = index;
  }

  void remove_account(const std::string_view address) {
    accounts_.erase(std::string{address});
  }

  /// The next `count` client calls throw transport_error.
  void fail_next_calls(const uint32_t count) { failing_calls_ = count; }

  /// Fail every call to block_results for `height` while set.
  void fail_height(const tally::schema::height_t height) {
    failing_height_ = height;
  }
  void clear_failing_height() { failing_height_ = 0; }

  /// block_results for `height` throws std::runtime_error while set.
  void break_height(const tally::schema::height_t height) {
    broken_height_ = height;
  }
  void clear_broken_height() { broken_height_ = 0; }

  /// While set, building a client throws transport_error.
  void refuse_connections(const bool refuse) { refuse_connections_ = refuse; }

  uint64_t commit_requests() const { return commit_requests_; }
  uint64_t block_requests() const { return block_requests_; }

  tally::rpc::connection::factory_t factory();

  tally::schema::height_t latest_height() {
    check();
    return head_;
  }

  tally::schema::block_result_t block_results(
      const tally::schema::height_t height) {
    check();
    ++block_requests_;
    if (failing_height_ != 0 && failing_height_ == height) {
      throw tally::common::transport_error{"injected block_results failure"};
    }
    if (broken_height_ != 0 && broken_height_ == height) {
      throw std::runtime_error{"injected unexpected failure"};
    }
    if (height > head_) {
      throw tally::common::transport_error{"height is not available yet"};
    }
    auto found = blocks_.find(height);
    if (found == blocks_.end()) {
      auto empty = tally::schema::block_result_t{};
      empty.height = height;
      return empty;
    }
    return found->second;
  }

  tally::schema::commit_t commit(const tally::schema::height_t height) {
    check();
    ++commit_requests_;
    auto found = commits_.find(height);
    if (found == commits_.end()) {
      auto empty = tally::schema::commit_t{};
      empty.height = height;
      return empty;
    }
    return found->second;
  }

  tally::schema::query_result_t abci_query(
      const std::string_view path,
      const tally::schema::bytes_view_t& data) {
    check();
    auto result = tally::schema::query_result_t{};
    if (path != tally::indexer::kAccountsQueryPath) {
      result.code = 6;
      result.log = "unknown query path";
      return result;
    }
    auto address = tally::schema::to_upper_hex(data);
    auto found = accounts_.find(address);
    if (found == accounts_.end()) {
      return result;
    }
    result.value = tally::schema::make_bytes(
        std::string{"{\"index\":"} + std::to_string(found->second) +
        ",\"address\":\"" + address + "\"}");
    return result;
  }

 private:
  void check() {
    if (failing_calls_ > 0) {
      --failing_calls_;
      throw tally::common::transport_error{"injected transport failure"};
    }
  }

  tally::schema::height_t head_{};
  std::map<tally::schema::height_t, tally::schema::block_result_t> blocks_;
  std::map<tally::schema::height_t, tally::schema::commit_t> commits_;
  std::map<std::string, tally::schema::validator_index_t> accounts_;
  uint32_t failing_calls_{};
  tally::schema::height_t failing_height_{};
  tally::schema::height_t broken_height_{};
  bool refuse_connections_{};
  uint64_t commit_requests_{};
  uint64_t block_requests_{};
};

class fake_chain_client final : public tally::rpc::chain_client {
 public:
  explicit fake_chain_client(fake_chain& chain) : chain_{chain} {}

  tally::schema::height_t latest_height() override {
    return chain_.latest_height();
  }

  tally::schema::block_result_t block_results(
      const tally::schema::height_t height) override {
    return chain_.block_results(height);
  }

  tally::schema::commit_t commit(const tally::schema::height_t height) override {
    return chain_.commit(height);
  }

  tally::schema::query_result_t abci_query(
      const std::string_view path,
      const tally::schema::bytes_view_t& data) override {
    return chain_.abci_query(path, data);
  }

 private:
  fake_chain& chain_;
};

inline tally::rpc::connection::factory_t fake_chain::factory() {
  return [this]() -> std::unique_ptr<tally::rpc::chain_client> {
    if (refuse_connections_) {
      throw tally::common::transport_error{"connection refused"};
    }
    return std::make_unique<fake_chain_client>(*this);
  };
}

}  // namespace tally::testing
