#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <mosaic/common/critical.hpp>
#include <mosaic/execution/engine.hpp>
#include <mosaic/node/server.hpp>
#include <mosaic/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <iostream>
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

namespace {

mosaic::schema::hash32_t parse_hash_option(const po::variables_map& vm,
                                           const std::string& name) {
  if (!vm.contains(name) || vm[name].as<std::string>().empty()) {
    return mosaic::schema::make_zero_hash();
  }
  auto value = mosaic::schema::try_make_hash32(vm[name].as<std::string>());
  if (!value) {
    mosaic::common::critical("--{} must be 32 bytes of hex", name);
  }
  return *value;
}

void configure_logging(const std::string& log_file,
                       const std::string& log_level) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "mosaic", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto base_uri = std::string{};
  auto royalty_bps = uint16_t{};
  auto strict_crypto = true;
  auto config_file = std::string{};

  auto description = po::options_description{"Mosaic registry node"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with the same options; command line wins")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the node service")(
      "db-path", po::value<std::string>(&db_path)->default_value("mosaic.db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>(&log_file)->default_value("mosaic.log"),
      "log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "chain-id", po::value<std::string>()->default_value(""),
      "chain id, 32 bytes hex")(
      "controller", po::value<std::string>()->default_value(""),
      "controller address, 32 bytes hex")(
      "base-uri", po::value<std::string>(&base_uri)->default_value(""),
      "initial metadata base URI")(
      "royalty-payee", po::value<std::string>()->default_value(""),
      "initial royalty payee, 32 bytes hex; defaults to the controller")(
      "royalty-bps", po::value<uint16_t>(&royalty_bps)->default_value(500),
      "initial royalty rate in basis points")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "verify ed25519 signatures");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  configure_logging(log_file, log_level);

  auto controller = parse_hash_option(vm, "controller");
  if (mosaic::schema::is_zero_address(controller)) {
    spdlog::warn("No --controller given; controller-only calls will fail");
  }
  auto options = mosaic::execution::engine_options{
      .chain_id = parse_hash_option(vm, "chain-id"),
      .require_strict_crypto = strict_crypto,
      .registry = mosaic::registry::registry_config{
          .controller = controller,
          .base_uri = base_uri,
          .royalty_payee = parse_hash_option(vm, "royalty-payee"),
          .royalty_basis_points = royalty_bps}};

  auto encoder = mosaic::schema::encoding::scale_encoder_t{};
  auto storage =
      mosaic::storage::make_storage<mosaic::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = mosaic::execution::engine{encoder, storage, options};

  spdlog::info("Node service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = mosaic::node::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server =
      std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    mosaic::common::critical("failed to start node service on {}",
                             grpc_address);
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
