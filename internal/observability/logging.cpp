#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace audit::observability {
namespace {

constexpr const char* kLoggerName     = "audit-store";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

std::string ResolveLevelName(const audit::runtime::config::LoggingConfig& config) {
  if (const char* env = Env("AUDIT_LOG_LEVEL")) return env;
  return config.level().empty() ? "info" : config.level();
}

std::string ResolvePattern(const audit::runtime::config::LoggingConfig& config) {
  if (const char* env = Env("AUDIT_LOG_PATTERN")) return env;
  return config.pattern().empty() ? kDefaultPattern : config.pattern();
}

bool ResolveTraceContextEnabled(const audit::runtime::config::LoggingConfig& config) {
  if (const char* env = Env("AUDIT_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(env);
    return value == "1" || value == "true";
  }
  return config.include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const audit::runtime::config::LoggingConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!config.file_path().empty()) {
    const std::size_t max_bytes = static_cast<std::size_t>(config.max_file_size_mb() > 0 ? config.max_file_size_mb() : 64) * 1024 * 1024;
    const std::size_t max_files = config.max_files() > 0 ? config.max_files() : 5;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.file_path(), max_bytes, max_files));
  }
  return sinks;
}

// Values containing whitespace, quotes or '=' are quoted.
void AppendValue(std::string& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \"=\t\n") == std::string::npos) {
    out += value;
    return;
  }

  out += '"';
  for (char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);

  out += " trace_id=" + HexId(trace_bytes, 16);
  out += " span_id=" + HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatLine(std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  return line;
}

void InitializeLogging(const audit::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto sinks  = BuildSinks(logging);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());

  const auto level_name = ResolveLevelName(logging);
  const auto level      = spdlog::level::from_str(level_name);
  const bool recognized = level != spdlog::level::off || level_name == "off";

  logger->set_pattern(ResolvePattern(logging));
  logger->set_level(recognized ? level : spdlog::level::info);
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = ResolveTraceContextEnabled(logging);

  if (!recognized) {
    LogWarn("Unknown log level, using info", {StringField("level", level_name)});
  }
  if (!logging.file_path().empty()) {
    LogInfo("Logging to file", {StringField("path", logging.file_path())});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  auto line = FormatLine(message, fields);
  AppendTraceContext(line);
  logger->log(level, "{}", line);
}

} // namespace audit::observability
