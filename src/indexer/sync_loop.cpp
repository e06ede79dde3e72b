#include <spdlog/spdlog.h>
#include <tally/common/errors.hpp>
#include <tally/indexer/sync_loop.hpp>
#include <algorithm>
#include <exception>
#include <thread>

namespace tally::indexer {

sync_loop::sync_loop(tally::rpc::connection& connection,
                     tally::store::record_store& store,
                     tally::agent::client& agent,
                     sync_options options)
    : connection_{connection},
      store_{store},
      agent_{agent},
      options_{options},
      accounts_{connection},
      dispatcher_{store},
      reconciler_{connection, accounts_, store} {
  next_height_ = store_.load_index_progress() + 1;
  spdlog::info("Indexer resumes at height {}", next_height_.load());
}

bool sync_loop::pause(const std::chrono::milliseconds duration,
                      const std::atomic<bool>& shutdown) {
  static constexpr auto kSlice = std::chrono::milliseconds{50};
  auto remaining = duration;
  while (remaining.count() > 0) {
    if (shutdown.load()) {
      return false;
    }
    auto step = std::min(remaining, kSlice);
    std::this_thread::sleep_for(step);
    remaining -= step;
  }
  return !shutdown.load();
}

void sync_loop::process_height(const tally::schema::height_t height) {
  auto block = connection_.call([&](tally::rpc::chain_client& client) {
    return client.block_results(height);
  });

  try {
    auto ordinal = uint32_t{0};
    for (const auto& tx : block.tx_results) {
      for (const auto& event : tx.events) {
        dispatcher_.dispatch(event.type, event, height, ordinal++);
      }
    }
    reconciler_.reconcile(height);
    if (!store_.save_index_progress(height)) {
      throw tally::common::inconsistency_error{fmt::format(
          "index progress is ahead of height {}", height)};
    }
  } catch (...) {
    dispatcher_.discard_pending();
    throw;
  }
  next_height_ = height + 1;

  auto undelivered = 0u;
  for (const auto& notification : dispatcher_.drain()) {
    if (!deliver(agent_, notification)) {
      ++undelivered;
    }
  }
  if (undelivered > 0) {
    spdlog::warn("{} agent notification(s) of height {} were not delivered",
                 undelivered, height);
  }
}

uint64_t sync_loop::tick(const std::atomic<bool>& shutdown) {
  if (shutdown.load()) {
    return 0;
  }
  if (!connection_.ensure()) {
    state_ = sync_state_t::idle;
    return 0;
  }

  state_ = sync_state_t::fetching_head;
  try {
    head_ = connection_.call(
        [](tally::rpc::chain_client& client) { return client.latest_height(); });
  } catch (const tally::common::transport_error& e) {
    spdlog::error("Failed to fetch chain head: {}", e.what());
    state_ = sync_state_t::idle;
    return 0;
  }

  auto indexed = uint64_t{0};
  while (next_height_ < head_) {
    if (shutdown.load()) {
      break;
    }
    state_ = sync_state_t::catching_up;
    auto height = next_height_.load();
    spdlog::debug("Indexing height {} of {}", height, head_.load());
    try {
      process_height(height);
    } catch (const tally::common::transport_error& e) {
      spdlog::error("Chain unavailable at height {}: {}", height, e.what());
      state_ = sync_state_t::idle;
      return indexed;
    } catch (const tally::common::inconsistency_error& e) {
      spdlog::error("Height {} is inconsistent with the replica: {}", height,
                    e.what());
      state_ = sync_state_t::idle;
      return indexed;
    } catch (const tally::common::storage_error& e) {
      spdlog::error("Failed to persist height {}: {}", height, e.what());
      state_ = sync_state_t::idle;
      return indexed;
    } catch (const std::exception& e) {
      spdlog::error("Unexpected failure at height {}: {}", height, e.what());
      state_ = sync_state_t::idle;
      return indexed;
    }
    ++indexed;
    if (next_height_ < head_ && !pause(options_.catch_up_delay, shutdown)) {
      break;
    }
  }

  if (next_height_ >= head_) {
    state_ = sync_state_t::synced;
  }
  if (indexed > 0) {
    spdlog::info("Indexed {} height(s), next height {}", indexed,
                 next_height_.load());
  }
  return indexed;
}

void sync_loop::run(const std::atomic<bool>& shutdown) {
  spdlog::info("Sync loop started (tick {} ms, catch-up delay {} ms)",
               options_.tick_interval.count(), options_.catch_up_delay.count());
  while (!shutdown.load()) {
    tick(shutdown);
    if (!pause(options_.tick_interval, shutdown)) {
      break;
    }
  }
  spdlog::info("Sync loop stopped at height {}", next_height_.load());
}

}  // namespace tally::indexer
