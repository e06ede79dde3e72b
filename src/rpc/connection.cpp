#include <spdlog/spdlog.h>
#include <tally/rpc/connection.hpp>

namespace tally::rpc {

connection::connection(factory_t factory) : factory_{std::move(factory)} {}

bool connection::ensure() {
  if (healthy_ && client_) {
    return true;
  }
  client_.reset();
  try {
    client_ = factory_();
  } catch (const tally::common::transport_error& e) {
    spdlog::error("Chain connection failed: {}", e.what());
    return false;
  }
  if (!client_) {
    spdlog::error("Chain connection factory returned no client");
    return false;
  }
  ++builds_;
  healthy_ = true;
  if (builds_ > 1) {
    spdlog::info("Reconnected to chain (attempt {})", builds_);
  }
  return true;
}

}  // namespace tally::rpc
