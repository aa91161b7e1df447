#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace audit::runtime::config {
class ServerConfig;
}

namespace audit::runtime {

struct ServerOptions {
  std::string bind_address = "0.0.0.0:50051";
  int max_receive_message_bytes = 16 * 1024 * 1024;
  std::chrono::milliseconds shutdown_grace{5000};
  bool health_service = true;

  static ServerOptions FromConfig(const config::ServerConfig& config);
};

/*
  Hosts the write, analytics and admin gRPC services.

  Stop() lets in-flight calls finish until the grace deadline, then cancels
  whatever is left. Requests arriving after Stop() are refused, which is what
  lets the DLQ worker drain against a queue that no longer grows.
*/
class Server {
public:
  Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  bool Running() const {
    return grpc_server_ != nullptr;
  }

  // Actual port after Start(); differs from the configured one when binding ":0".
  int BoundPort() const {
    return bound_port_;
  }

private:
  ServerOptions options_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int bound_port_ = 0;
};

} // namespace audit::runtime
