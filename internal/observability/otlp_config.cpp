#include "internal/observability/spans.hpp"

#include "config/config.pb.h"
#include "internal/util/uuid.hpp"

namespace audit::observability {

OtlpConfig ToOtlpConfig(const audit::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig out;
  if (!observability.service_name().empty()) out.service_name = observability.service_name();
  out.service_instance_id = util::GenerateUUIDString();
  out.environment         = observability.environment();
  out.endpoint            = observability.otlp_endpoint();
  out.transport =
      observability.transport() == audit::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  out.insecure = !observability.otlp_use_tls();

  const double ratio = observability.tracing().sample_ratio();
  out.sample_ratio   = ratio > 0.0 && ratio <= 1.0 ? ratio : 1.0;
  return out;
}

} // namespace audit::observability
