#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/runtime/background_worker.hpp"

namespace audit::factory {

/*
  Application

  Everything the process keeps alive: gRPC adapters handed to the server
  and background workers started after the graph is built.
*/
struct Application {
  std::vector<std::unique_ptr<grpc::Service>>             grpc_services;
  std::vector<std::shared_ptr<runtime::BackgroundWorker>> background_workers;
};

/*
  Build

  Composition root. The only place that knows concrete store and queue
  types. Runs schema migrations and provisions partitions before
  returning, so the server never starts against a store it cannot write.
*/
Application Build(const audit::runtime::config::RuntimeConfig& config);

} // namespace audit::factory
