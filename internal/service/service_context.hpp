#pragma once

#include <memory>

namespace audit::core {
class IngestionGateway;
class EventStore;
class ChainVerifier;
} // namespace audit::core
namespace audit::analytics {
class AggregationEngine;
}
namespace audit::dlq {
class Queue;
class RecoveryWorker;
} // namespace audit::dlq

namespace audit::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<audit::core::IngestionGateway>     gateway;
  std::shared_ptr<audit::core::EventStore>           store;
  std::shared_ptr<audit::core::ChainVerifier>        chain_verifier;
  std::shared_ptr<audit::analytics::AggregationEngine> analytics;
  std::shared_ptr<audit::dlq::Queue>                 dlq;
  std::shared_ptr<audit::dlq::RecoveryWorker>        recovery;
};

} // namespace audit::service
