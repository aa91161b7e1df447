#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace audit::runtime::config {
class RuntimeConfig;
}

namespace audit::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter target and service identity shared by traces and metrics.
struct OtlpConfig {
  std::string   service_name{"audit-store"};
  std::string   service_version{"0.1.0"};
  std::string   service_instance_id{};
  std::string   environment{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  double        sample_ratio{1.0};
};

OtlpConfig ToOtlpConfig(const audit::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const audit::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const audit::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide metrics sink. Every call is a no-op until
  InitializeMetrics() installed a provider (or when built without
  OpenTelemetry).
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // kind: "event" | "action_trace"; result: stored | duplicate | queued | rejected
  void RecordIngest(std::string_view kind, std::string_view result);
  void RecordValidationFailure(std::string_view reason);
  void ObserveWriteLatencyMs(std::string_view kind, double latency_ms);
  void RecordDlqFallback(std::string_view destination);
  void RecordDeadLetter(std::string_view destination);
  void RecordPartitionMissing(std::string_view kind);
  void SetDlqDepth(std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const audit::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const audit::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordIngest(std::string_view, std::string_view) {
}

inline void Metrics::RecordValidationFailure(std::string_view) {
}

inline void Metrics::ObserveWriteLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordDlqFallback(std::string_view) {
}

inline void Metrics::RecordDeadLetter(std::string_view) {
}

inline void Metrics::RecordPartitionMissing(std::string_view) {
}

inline void Metrics::SetDlqDepth(std::uint64_t) {
}
#endif

} // namespace audit::observability
