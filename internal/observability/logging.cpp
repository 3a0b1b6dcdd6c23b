#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace recall::observability {
namespace {

constexpr const char* kLoggerName     = "recall-scheduler";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

// RECALL_LOG_* environment variables win over the config file.
std::optional<std::string> EnvOverride(const char* name) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::string Pick(const char* env_name, const std::string& configured, const char* fallback) {
  if (auto value = EnvOverride(env_name)) return *value;
  return configured.empty() ? std::string(fallback) : configured;
}

// Values with spaces or quotes are quoted so lines stay key=value parseable.
void AppendField(std::string& line, const LogField& field) {
  line += ' ';
  line += field.key;
  line += '=';
  if (field.value.find_first_of(" \"=") == std::string::npos && !field.value.empty()) {
    line += field.value;
    return;
  }
  line += '"';
  for (char c : field.value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c;
  }
  line += '"';
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string ToHex(const uint8_t (&bytes)[N]) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out(N * 2, '0');
  for (std::size_t i = 0; i < N; ++i) {
    out[2 * i]     = kHex[bytes[i] >> 4];
    out[2 * i + 1] = kHex[bytes[i] & 0x0F];
  }
  return out;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  const auto span    = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  const auto context = span ? span->GetContext() : opentelemetry::trace::SpanContext::GetInvalid();
  if (!context.IsValid()) return;

  uint8_t trace_id[16];
  uint8_t span_id[8];
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);
  AppendField(line, {"trace_id", ToHex(trace_id)});
  AppendField(line, {"span_id", ToHex(span_id)});
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

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const recall::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::get(kLoggerName);
  if (!logger) logger = spdlog::stdout_color_mt(kLoggerName);

  logger->set_pattern(Pick("RECALL_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(Pick("RECALL_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (auto include = EnvOverride("RECALL_LOG_INCLUDE_TRACE_CONTEXT")) {
    g_include_trace_context = *include == "1" || *include == "true";
  } else {
    g_include_trace_context = logging.include_trace_context();
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) AppendField(line, field);
  AppendTraceContext(line);
  spdlog::log(level, "{}", line);
}

} // namespace recall::observability
