#include <boost/program_options.hpp>
#include <tally/config/options.hpp>
#include <cstdint>
#include <sstream>

namespace tally::config {

namespace po = boost::program_options;

options parse_options(const int argc, const char* const argv[]) {
  auto parsed = options{};
  auto tick_interval_ms = uint64_t{};
  auto catch_up_delay_ms = uint64_t{};
  auto http_timeout_ms = uint64_t{};
  auto log_level = std::string{};

  auto description = po::options_description{"Tally governance indexer"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(),
      "INI file providing any of the options below")(
      "chain-url",
      po::value<std::string>(&parsed.chain_url)
          ->default_value(parsed.chain_url),
      "CometBFT RPC endpoint")(
      "db-path",
      po::value<std::string>(&parsed.db_path)->default_value(parsed.db_path),
      "RocksDB directory of the indexed replica")(
      "agent-url",
      po::value<std::string>(&parsed.agent_url)
          ->default_value(parsed.agent_url),
      "Advisory agent endpoint; empty disables the agent")(
      "grpc-address",
      po::value<std::string>(&parsed.grpc_address)
          ->default_value(parsed.grpc_address),
      "IP:Port for the query service")(
      "tick-interval-ms",
      po::value<uint64_t>(&tick_interval_ms)
          ->default_value(static_cast<uint64_t>(parsed.tick_interval.count())),
      "Pause between sync ticks")(
      "catch-up-delay-ms",
      po::value<uint64_t>(&catch_up_delay_ms)
          ->default_value(static_cast<uint64_t>(parsed.catch_up_delay.count())),
      "Pause between heights while catching up")(
      "http-timeout-ms",
      po::value<uint64_t>(&http_timeout_ms)
          ->default_value(static_cast<uint64_t>(parsed.http_timeout.count())),
      "Timeout of one chain or agent HTTP request")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file",
      po::value<std::string>(&parsed.log_file)->default_value(parsed.log_file),
      "Log file, empty for console only");

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file<char>(
                  vm["config"].as<std::string>().c_str(), description),
              vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    auto help = std::ostringstream{};
    help << description;
    parsed.show_help = true;
    parsed.help_text = help.str();
  }

  parsed.log_level = spdlog::level::from_str(log_level);
  if (parsed.log_level == spdlog::level::off && log_level != "off") {
    throw po::invalid_option_value{log_level};
  }
  parsed.tick_interval = std::chrono::milliseconds{tick_interval_ms};
  parsed.catch_up_delay = std::chrono::milliseconds{catch_up_delay_ms};
  parsed.http_timeout = std::chrono::milliseconds{http_timeout_ms};
  return parsed;
}

}  // namespace tally::config
