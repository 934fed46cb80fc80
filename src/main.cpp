#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <reliquary/execution/engine.hpp>
#include <reliquary/rpc/server.hpp>
#include <reliquary/schema/encoding/scale/encoder.hpp>
#include <reliquary/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
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

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Reliquary"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26660"),
      "IP:Port for the registry gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "reliquary.db"),
      "RocksDB directory holding registry state")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "reliquary.log"),
      "Log file path")("verbose,v", "Enable debug logging");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto encoder = reliquary::schema::encoding::encoder<
      reliquary::schema::encoding::scale_encoder_tag>{};
  auto storage = reliquary::storage::make_storage<
      reliquary::storage::rocksdb_storage_tag>(db_path);
  auto engine = reliquary::execution::engine{encoder, storage};

  spdlog::info("Registry gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = reliquary::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
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

  spdlog::info("Registry stopped at height {}",
               engine.info().last_block_height);
  spdlog::shutdown();
  return 0;
}
