#pragma once

#include <tally/agent/client.hpp>
#include <tally/indexer/account_lookup.hpp>
#include <tally/indexer/dispatcher.hpp>
#include <tally/indexer/vote_reconciler.hpp>
#include <tally/rpc/connection.hpp>
#include <tally/schema/enum_string.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/store/record_store.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string_view>
#include <utility>

namespace tally::indexer {

enum class sync_state_t : uint8_t {
  idle = 0,
  fetching_head = 1,
  catching_up = 2,
  synced = 3
};

inline constexpr auto kSyncStateMappings = std::array{
    std::pair<std::string_view, sync_state_t>{"idle", sync_state_t::idle},
    std::pair<std::string_view, sync_state_t>{"fetching_head",
                                              sync_state_t::fetching_head},
    std::pair<std::string_view, sync_state_t>{"catching_up",
                                              sync_state_t::catching_up},
    std::pair<std::string_view, sync_state_t>{"synced", sync_state_t::synced}};

inline constexpr std::string_view to_string(const sync_state_t value) {
  return tally::schema::to_string(value, kSyncStateMappings)
      .value_or("unknown");
}

struct sync_options final {
  std::chrono::milliseconds tick_interval{1000};
  /// Pause between consecutive heights while catching up.
  std::chrono::milliseconds catch_up_delay{100};
};

/// Resumable, height-ordered indexing of the chain.
///
/// Each tick fetches the chain head and indexes every height below it, one at
/// a time: block results are dispatched in chain order, commit signatures are
/// reconciled, then the height is persisted as indexed. A failure anywhere
/// aborts the tick without advancing, so the same height is retried on the
/// next tick. Agent notifications of a height are delivered only after it is
/// persisted.
class sync_loop final {
 public:
  sync_loop(tally::rpc::connection& connection,
            tally::store::record_store& store,
            tally::agent::client& agent,
            sync_options options = {});

  /// Returns the number of heights indexed during the tick.
  uint64_t tick(const std::atomic<bool>& shutdown);

  /// Tick until `shutdown` is set.
  void run(const std::atomic<bool>& shutdown);

  /// Index one height end to end. Progress is untouched when it throws.
  void process_height(tally::schema::height_t height);

  tally::schema::height_t next_height() const { return next_height_.load(); }
  tally::schema::height_t head() const { return head_.load(); }
  sync_state_t state() const { return state_.load(); }

 private:
  /// Sleep up to `duration`, waking early on shutdown. Returns false on
  /// shutdown.
  static bool pause(std::chrono::milliseconds duration,
                    const std::atomic<bool>& shutdown);

  tally::rpc::connection& connection_;
  tally::store::record_store& store_;
  tally::agent::client& agent_;
  sync_options options_;
  account_lookup accounts_;
  dispatcher dispatcher_;
  vote_reconciler reconciler_;
  std::atomic<sync_state_t> state_{sync_state_t::idle};
  std::atomic<tally::schema::height_t> next_height_{1};
  std::atomic<tally::schema::height_t> head_{0};
};

}  // namespace tally::indexer
