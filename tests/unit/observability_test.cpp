#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace {

using audit::observability::BoolField;
using audit::observability::FormatLine;
using audit::observability::IntField;
using audit::observability::StringField;

void TestFormatLine() {
  assert(FormatLine("DLQ entry replayed", {}) == "DLQ entry replayed");

  assert(FormatLine("DLQ entry replayed", {StringField("entry_id", "abc"), IntField("retry_count", 2),
                                           BoolField("final", false)}) ==
         "DLQ entry replayed entry_id=abc retry_count=2 final=false");
}

void TestFormatLineQuotesValues() {
  assert(FormatLine("Record rejected", {StringField("error", "service is required")}) ==
         "Record rejected error=\"service is required\"");
  assert(FormatLine("x", {StringField("empty", "")}) == "x empty=\"\"");
  assert(FormatLine("x", {StringField("q", "say \"hi\"")}) == "x q=\"say \\\"hi\\\"\"");
  assert(FormatLine("x", {StringField("kv", "a=b")}) == "x kv=\"a=b\"");
  assert(FormatLine("x", {StringField("nl", "a\nb")}) == "x nl=\"a\\nb\"");
}

void TestOtlpDefaults() {
  const auto config = audit::config::ConfigLoader::LoadFromYamlString("server:\n  bind_address: \"127.0.0.1:0\"\n");
  const auto otlp   = audit::observability::ToOtlpConfig(config);

  assert(otlp.service_name == "audit-store");
  assert(otlp.transport == audit::observability::OtlpTransport::kGrpc);
  assert(otlp.insecure);
  assert(otlp.sample_ratio == 1.0);
  assert(otlp.environment.empty());
  assert(otlp.service_instance_id.size() == 36);
}

void TestOtlpFromConfig() {
  const auto config = audit::config::ConfigLoader::LoadFromYamlString(
      "observability:\n"
      "  service_name: audit-store-eu\n"
      "  environment: staging\n"
      "  otlp_endpoint: \"http://collector:4318/v1/traces\"\n"
      "  transport: OTLP_TRANSPORT_HTTP\n"
      "  otlp_use_tls: true\n"
      "  tracing:\n"
      "    sample_ratio: 0.25\n");
  const auto otlp = audit::observability::ToOtlpConfig(config);

  assert(otlp.service_name == "audit-store-eu");
  assert(otlp.environment == "staging");
  assert(otlp.endpoint == "http://collector:4318/v1/traces");
  assert(otlp.transport == audit::observability::OtlpTransport::kHttpProtobuf);
  assert(!otlp.insecure);
  assert(otlp.sample_ratio == 0.25);
}

} // namespace

int main() {
  TestFormatLine();
  TestFormatLineQuotesValues();
  TestOtlpDefaults();
  TestOtlpFromConfig();

  std::cout << "audit_store_unit_observability: pass\n";
  return 0;
}
