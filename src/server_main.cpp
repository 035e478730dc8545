#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "bsm/grpc_service.hpp"
#include "bsm/server_config.hpp"
#include "bsm/time_basis.hpp"

int main(int argc, char** argv) {
  const bsm::ServerConfigOutcome loaded = bsm::load_server_config(argc, argv);
  if (!loaded.status.ok()) {
    std::cerr << "Invalid server configuration: " << loaded.status.message << '\n';
    return EXIT_FAILURE;
  }
  const bsm::ServerConfig& config = loaded.config;

  bsm::OptionEngineService service(bsm::EngineConfig{}, config.valuation_date);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Failed to start gRPC server on " << config.listen_address << '\n';
    return EXIT_FAILURE;
  }

  std::cout << "option engine gRPC server listening on " << config.listen_address << std::endl;
  if (config.valuation_date) {
    std::cout << "valuation date pinned to " << bsm::format_calendar_date(*config.valuation_date) << std::endl;
  } else {
    std::cout << "valuation date follows UTC, today " << bsm::format_calendar_date(bsm::today_utc()) << std::endl;
  }
  server->Wait();
  return EXIT_SUCCESS;
}
