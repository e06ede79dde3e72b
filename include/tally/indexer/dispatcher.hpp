#pragma once

#include <tally/indexer/notification.hpp>
#include <tally/schema/chain_event.hpp>
#include <tally/schema/event_type.hpp>
#include <tally/schema/primitives.hpp>
#include <tally/schema/transaction_event.hpp>
#include <tally/store/record_store.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace tally::indexer {

/// Routes block-result events to their handlers by event type.
///
/// Events are decoded into chain_event_t before the handler runs. Decode
/// failures, settlements of proposals that were never indexed and record-store
/// write failures are logged and the event is dropped.
class dispatcher final {
 public:
  using handler_t = std::function<
      void(tally::schema::chain_event_t&, tally::schema::height_t, uint32_t)>;

  explicit dispatcher(tally::store::record_store& store);

  /// `ordinal` is the position of the event among all events of `height`.
  /// Returns false when no handler is registered for `type`.
  bool dispatch(std::string_view type,
                const tally::schema::transaction_event_t& event,
                tally::schema::height_t height,
                uint32_t ordinal);

  /// Hand over the notifications queued since the last drain.
  std::vector<agent_notification_t> drain();

  /// Drop queued notifications of a height that did not complete.
  void discard_pending();

  std::size_t pending() const { return pending_.size(); }

 private:
  template <typename Event>
  void route(tally::schema::event_type_t type,
             void (dispatcher::*handler)(Event,
                                         tally::schema::height_t,
                                         uint32_t));

  void on_grant(tally::schema::grant_event_t event,
                tally::schema::height_t height,
                uint32_t ordinal);
  void on_discussion(tally::schema::discussion_event_t event,
                     tally::schema::height_t height,
                     uint32_t ordinal);
  void on_proposal(tally::schema::proposal_event_t event,
                   tally::schema::height_t height,
                   uint32_t ordinal);
  void on_settle_proposal(tally::schema::settle_proposal_event_t event,
                          tally::schema::height_t height,
                          uint32_t ordinal);

  tally::store::record_store& store_;
  std::map<std::string, handler_t, std::less<>> handlers_;
  std::vector<agent_notification_t> pending_;
};

}  // namespace tally::indexer
