#pragma once

#include <memory>
#include <string_view>

namespace recall::runtime::config {
class RuntimeConfig;
}

namespace recall::observability {

bool InitializeMetrics(const recall::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

// How a complete-review call ended, as counted by recall.review.completions.
enum class CompletionOutcome {
  kApplied,
  kReplayed, // same quality resubmitted inside the replay window
  kConflict, // rejected by the concurrency guard
};

std::string_view CompletionOutcomeName(CompletionOutcome outcome);

class Metrics {
 public:
  static Metrics& Instance();

  // One call per finished RPC, successful or not.
  void RecordRpc(std::string_view route, bool success, double latency_ms);

  // quality is only attached for applied completions.
  void RecordCompletion(CompletionOutcome outcome, int quality = -1);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

inline std::string_view CompletionOutcomeName(CompletionOutcome outcome) {
  switch (outcome) {
    case CompletionOutcome::kApplied:
      return "applied";
    case CompletionOutcome::kReplayed:
      return "replayed";
    case CompletionOutcome::kConflict:
      return "conflict";
  }
  return "unknown";
}

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const recall::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordCompletion(CompletionOutcome, int) {
}
#endif

} // namespace recall::observability
