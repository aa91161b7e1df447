#include "server.hpp"

#include <stdexcept>

#include <grpcpp/health_check_service_interface.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace audit::runtime {

using audit::observability::IntField;
using audit::observability::StringField;

ServerOptions ServerOptions::FromConfig(const config::ServerConfig& config) {
  ServerOptions options;
  if (!config.bind_address().empty()) options.bind_address = config.bind_address();
  if (config.max_receive_message_mb() > 0) {
    options.max_receive_message_bytes = static_cast<int>(config.max_receive_message_mb()) * 1024 * 1024;
  }
  if (config.shutdown_grace_ms() > 0) options.shutdown_grace = std::chrono::milliseconds(config.shutdown_grace_ms());
  options.health_service = !config.health_service_disabled();
  return options;
}

Server::Server(ServerOptions options, std::vector<std::unique_ptr<grpc::Service>> services)
    : options_(std::move(options)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) return;

  // process-wide switch; must be set before the builder is created
  grpc::EnableDefaultHealthCheckService(options_.health_service);

  grpc::ServerBuilder builder;
  builder.AddListeningPort(options_.bind_address, grpc::InsecureServerCredentials(), &bound_port_);
  builder.SetMaxReceiveMessageSize(options_.max_receive_message_bytes);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || bound_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to start gRPC server on " + options_.bind_address);
  }

  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(true);
  }

  AUDIT_LOG_INFO("gRPC server listening",
                 {StringField("bind_address", options_.bind_address), IntField("port", bound_port_),
                  IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;

  if (auto* health = grpc_server_->GetHealthCheckService()) {
    health->SetServingStatus(false);
  }

  grpc_server_->Shutdown(std::chrono::system_clock::now() + options_.shutdown_grace);
  grpc_server_.reset();
  AUDIT_LOG_INFO("gRPC server stopped", {IntField("grace_ms", options_.shutdown_grace.count())});
}

} // namespace audit::runtime
