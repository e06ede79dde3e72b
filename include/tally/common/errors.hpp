#pragma once

#include <stdexcept>
#include <string>

namespace tally::common {

/// Chain or agent endpoint unreachable, connection dropped, or a response that
/// does not follow the remote protocol. Always transient from the indexer's
/// point of view.
struct transport_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// Chain data contradicts the indexed replica (unknown commit signer, progress
/// ahead of the height being stored). Retrying faster does not help; the
/// height is retried on the next tick.
struct inconsistency_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/// RocksDB rejected a read or write.
struct storage_error final : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

}  // namespace tally::common
