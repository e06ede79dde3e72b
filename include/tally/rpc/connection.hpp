#pragma once

#include <tally/common/errors.hpp>
#include <tally/rpc/chain_client.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

namespace tally::rpc {

/// The single guarded accessor to the consensus node.
///
/// Owns the live chain_client and its health flag. A call that fails with
/// transport_error marks the connection unhealthy and rethrows; the next
/// ensure() (or call()) discards the client and builds a fresh one from the
/// factory.
class connection final {
 public:
  using factory_t = std::function<std::unique_ptr<chain_client>()>;

  explicit connection(factory_t factory);

  /// Rebuild the client when unhealthy. Returns false when the factory fails.
  bool ensure();

  bool healthy() const { return healthy_; }

  void mark_unhealthy() { healthy_ = false; }

  /// Number of clients built so far.
  uint64_t builds() const { return builds_; }

  template <typename Fn>
  decltype(auto) call(Fn&& fn) {
    if (!ensure()) {
      throw tally::common::transport_error{"chain connection unavailable"};
    }
    try {
      return std::forward<Fn>(fn)(*client_);
    } catch (const tally::common::transport_error&) {
      mark_unhealthy();
      throw;
    }
  }

 private:
  factory_t factory_;
  std::unique_ptr<chain_client> client_;
  bool healthy_{false};
  uint64_t builds_{};
};

}  // namespace tally::rpc
