#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>

#include "IDServiceImpl.hpp"
#include "SigIntWaiter.hpp"

using grpc::Server;
using grpc::ServerBuilder;

void PrintUsage() {
  std::cerr << "Usage: ./id-server [listen_address]" << std::endl;
}

void RunServer(const std::string& server_address, const SigIntWaiter& sig_int_waiter) {
  IDServiceImpl service;

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();
  ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (server == nullptr) {
    std::cerr << "Could not listen on " << server_address << "." << std::endl;
    exit(1);
  }
  std::cout << "Server listening on " << server_address << std::endl;

  // Serve on a separate thread, the main thread blocks until SIGINT.
  std::thread t([&] () -> void { server->Wait(); });
  if (sig_int_waiter.Wait()) {
    std::cout << "Caught SIGINT." << std::endl;
  } else {
    std::cerr << "sigwait failed, shutting down." << std::endl;
  }
  server->Shutdown();
  t.join();
}

int main(int argc, char** argv) {
  if (argc > 2) {
    PrintUsage();
    exit(1);
  }
  std::string server_address = argc == 2 ? argv[1] : "0.0.0.0:12000";

  // Block SIGINT before any gRPC thread is started so they all inherit the
  // mask.
  SigIntWaiter sig_int_waiter;
  RunServer(server_address, sig_int_waiter);
  std::cout << "Bye." << std::endl;
  return 0;
}
