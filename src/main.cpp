#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options/errors.hpp>
#include <tally/agent/eliza_client.hpp>
#include <tally/agent/noop_client.hpp>
#include <tally/api/listener.hpp>
#include <tally/common/critical.hpp>
#include <tally/common/errors.hpp>
#include <tally/config/options.hpp>
#include <tally/indexer/sync_loop.hpp>
#include <tally/query/service.hpp>
#include <tally/rpc/cometbft/http_chain_client.hpp>
#include <tally/rpc/connection.hpp>
#include <tally/store/record_store.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto options = tally::config::options{};
  try {
    options = tally::config::parse_options(argc, argv);
  } catch (const boost::program_options::error& e) {
    std::cerr << "tally-indexer: " << e.what() << std::endl;
    return 1;
  }
  if (options.show_help) {
    std::cout << options.help_text << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!options.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        options.log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.log_level);

  auto storage =
      tally::storage::make_storage<tally::storage::rocksdb_storage_tag>(
          options.db_path);
  auto encoder = tally::store::encoder_t{};
  auto store = tally::store::record_store{encoder, storage};
  if (!store.migrate()) {
    tally::common::critical("Record store was written by a newer release");
  }

  auto agent = std::unique_ptr<tally::agent::client>{};
  if (options.agent_url.empty()) {
    spdlog::info("No agent configured");
    agent = std::make_unique<tally::agent::noop_client>();
  } else {
    try {
      agent = std::make_unique<tally::agent::eliza_client>(
          options.agent_url, options.http_timeout);
    } catch (const tally::common::transport_error& e) {
      spdlog::error("Agent at {} unavailable: {}", options.agent_url,
                    e.what());
      tally::common::critical("Failed to connect to the advisory agent");
    }
  }

  auto connection = tally::rpc::connection{[&options] {
    return std::unique_ptr<tally::rpc::chain_client>{
        std::make_unique<tally::rpc::cometbft::http_chain_client>(
            options.chain_url, options.http_timeout)};
  }};

  auto sync_options = tally::indexer::sync_options{};
  sync_options.tick_interval = options.tick_interval;
  sync_options.catch_up_delay = options.catch_up_delay;
  auto loop =
      tally::indexer::sync_loop{connection, store, *agent, sync_options};

  auto query_service = tally::query::service{store, &loop};
  auto grpc_listener = tally::api::listener{query_service};

  spdlog::info("Query service listening on {}", options.grpc_address);
  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(options.grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    tally::common::critical("Failed to start the query service");
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] { loop.run(shutdown_requested()); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("Indexed through height {}", store.load_index_progress());
  spdlog::shutdown();
  return 0;
}
