#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "optiview/config.hpp"
#include "optiview/grpc_service.hpp"

int main(int argc, char** argv) {
  const auto config = optiview::parse_server_config(argc, argv);
  if (!config) {
    std::cerr << "Invalid configuration: " << config.error().message << '\n';
    std::cerr << "usage: " << argv[0]
              << " [HOST:PORT] [--address=HOST:PORT] [--default-rate=R] [--max-grid-points=N]\n";
    return EXIT_FAILURE;
  }
  const std::string& address = config.value().address;

  // Market data is fetched upstream; requests carry spot and volatility.
  optiview::PricingGrpcService service(config.value());

  grpc::ServerBuilder builder;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);

  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    std::cerr << "Failed to start gRPC server on " << address << '\n';
    return EXIT_FAILURE;
  }

  std::cout << "optiview pricing server listening on " << address
            << " (default rate " << config.value().default_rate
            << ", max grid points " << config.value().max_grid_points << ")" << std::endl;
  server->Wait();
  return EXIT_SUCCESS;
}
