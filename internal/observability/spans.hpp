#pragma once

#include <memory>
#include <string_view>

namespace recall::runtime::config {
class RuntimeConfig;
}

namespace recall::observability {

// Installs the global tracer provider. Returns false when tracing is
// disabled in config or the build has no OTLP support.
bool InitializeTracing(const recall::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span: started on construction, made the active span for the
  current thread, ended on destruction. Every method is a no-op when no
  tracer is installed.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);

  // Marks the span failed.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const recall::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept            = default;
inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace recall::observability
