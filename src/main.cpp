#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tessera/abci/server.hpp>
#include <tessera/common/critical.hpp>
#include <tessera/execution/engine.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

struct genesis_options final {
  std::string name;
  std::string symbol;
  std::string initial_supply;
  std::string max_supply;
  std::string creator;
};

// Build the fallback genesis used when InitChain carries no app state.
// Returns nullopt when no creator is configured.
std::optional<tessera::schema::genesis_t> make_default_genesis(
    const genesis_options& options) {
  if (options.creator.empty()) {
    return std::nullopt;
  }
  auto creator = tessera::schema::try_make_hash32(options.creator);
  auto initial_supply = tessera::schema::try_parse_amount(options.initial_supply);
  auto max_supply = tessera::schema::try_parse_amount(options.max_supply);
  if (!creator || !initial_supply || !max_supply) {
    throw std::invalid_argument{
        "genesis.creator must be 64 hex chars and supplies decimal integers"};
  }
  return tessera::schema::genesis_t{.name = options.name,
                                    .symbol = options.symbol,
                                    .initial_supply = *initial_supply,
                                    .max_supply = *max_supply,
                                    .creator = *creator};
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto grpc_port = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_path = std::string{};
  auto strict_crypto = true;
  auto genesis = genesis_options{};

  auto description = po::options_description{"Tessera"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI configuration file; command line values take precedence")(
      "grpc-port,g",
      po::value<std::string>(&grpc_port)->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d", po::value<std::string>(&db_path)->default_value("tessera.db"),
      "RocksDB directory")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value("tessera.log"),
      "Log file path")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify ed25519/secp256k1 signatures and reject named signers")(
      "genesis.name", po::value<std::string>(&genesis.name)->default_value(""),
      "Token name used when InitChain carries no app state")(
      "genesis.symbol",
      po::value<std::string>(&genesis.symbol)->default_value(""),
      "Token symbol")("genesis.initial-supply",
                      po::value<std::string>(&genesis.initial_supply)
                          ->default_value("0"),
                      "Initial supply credited to the creator")(
      "genesis.max-supply",
      po::value<std::string>(&genesis.max_supply)->default_value("0"),
      "Maximum total supply")(
      "genesis.creator",
      po::value<std::string>(&genesis.creator)->default_value(""),
      "Creator account id (hex)");

  auto vm = po::variables_map{};
  auto default_genesis = std::optional<tessera::schema::genesis_t>{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
    if (vm.contains("help")) {
      std::cout << description << std::endl;
      return 0;
    }
    default_genesis = make_default_genesis(genesis);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << std::endl;
    std::cerr << description << std::endl;
    return 1;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tessera", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto encoder = tessera::execution::encoder_t{};
  auto storage =
      tessera::storage::make_storage<tessera::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = tessera::execution::engine{encoder, storage, strict_crypto};
  if (!default_genesis) {
    spdlog::info("No genesis configured; InitChain must carry app state");
  }

  auto copy = grpc_port;
  std::ranges::replace(copy, ':', ' ');
  spdlog::info("gRPC service listening on {}", copy);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = tessera::abci::listener{engine, default_genesis};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_port, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    tessera::common::critical("failed to start gRPC server");
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutdown requested");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
