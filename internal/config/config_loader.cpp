#include "config_loader.hpp"

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "internal/analytics/time_range.hpp"

namespace audit::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static audit::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  audit::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  return config;
}

static void DefaultDuration(google::protobuf::Duration* d, int64_t seconds) {
  if (d->seconds() == 0 && d->nanos() == 0) {
    d->set_seconds(seconds);
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

audit::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

audit::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(audit::runtime::config::RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50051");

  auto* database = config.mutable_database();
  if (database->backend_case() == audit::runtime::config::DatabaseConfig::BACKEND_NOT_SET) database->mutable_memory();
  if (database->has_sqlite() && database->sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database->has_postgres() && database->postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
  if (database->has_postgres() && database->postgres().max_connections() == 0) {
    database->mutable_postgres()->set_max_connections(16);
  }
  DefaultDuration(database->mutable_write_timeout(), 2);

  auto* partitions = config.mutable_partitions();
  if (partitions->months_ahead() == 0) partitions->set_months_ahead(2);
  if (partitions->months_behind() == 0) partitions->set_months_behind(1);
  DefaultDuration(partitions->mutable_maintenance_interval(), 3600);

  auto* dlq = config.mutable_dlq();
  if (dlq->backend_case() == audit::runtime::config::DlqConfig::BACKEND_NOT_SET) dlq->mutable_memory();
  if (dlq->has_sqlite() && dlq->sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: dlq.sqlite.path is required");
  }
  if (dlq->max_retries() == 0) dlq->set_max_retries(6);
  DefaultDuration(dlq->mutable_initial_backoff(), 1);
  DefaultDuration(dlq->mutable_max_backoff(), 300);
  DefaultDuration(dlq->mutable_poll_interval(), 1);
  if (dlq->workers() == 0) dlq->set_workers(1);
  if (dlq->workers() > 8) dlq->set_workers(8);
  if (dlq->batch_size() == 0) dlq->set_batch_size(10);
  DefaultDuration(dlq->mutable_lease_duration(), 30);
  if (dlq->max_entries() == 0) dlq->set_max_entries(10000);
  DefaultDuration(dlq->mutable_shutdown_drain_timeout(), 10);

  auto* analytics = config.mutable_analytics();
  if (analytics->default_time_range().empty()) analytics->set_default_time_range("7d");
  if (!audit::analytics::ParseTimeRange(analytics->default_time_range())) {
    throw std::runtime_error("Invalid configuration: analytics.default_time_range must be one of 1h, 24h, 7d, 30d, 90d");
  }
  if (analytics->default_min_samples() < 0) {
    throw std::runtime_error("Invalid configuration: analytics.default_min_samples must be positive");
  }
  if (analytics->default_min_samples() == 0) analytics->set_default_min_samples(5);

  auto* observability = config.mutable_observability();
  if (observability->service_name().empty()) observability->set_service_name("audit-store");
  const double sample_ratio = observability->tracing().sample_ratio();
  if (sample_ratio < 0.0 || sample_ratio > 1.0) {
    throw std::runtime_error("Invalid configuration: observability.tracing.sample_ratio must be within [0, 1]");
  }
}

} // namespace audit::config
