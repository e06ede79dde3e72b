#pragma once

#include <spdlog/common.h>
#include <chrono>
#include <optional>
#include <string>

namespace tally::config {

struct options final {
  std::string chain_url{"http://127.0.0.1:26657"};
  std::string db_path{"tally.db"};
  /// Empty selects the no-op agent.
  std::string agent_url;
  std::string grpc_address{"0.0.0.0:9090"};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds catch_up_delay{100};
  std::chrono::milliseconds http_timeout{10000};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"tally.log"};
  bool show_help{};
  std::string help_text;
};

/// Parse the command line, then the `--config` INI file when one is named.
/// Command-line values win over file values. Throws
/// boost::program_options::error on unknown options, malformed values or an
/// unreadable config file.
options parse_options(int argc, const char* const argv[]);

}  // namespace tally::config
