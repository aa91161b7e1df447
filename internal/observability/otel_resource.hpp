#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include "internal/observability/spans.hpp"

namespace audit::observability {

// service.* and deployment.environment attributes for both providers.
opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config);

} // namespace audit::observability

#endif
