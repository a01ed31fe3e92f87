#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace chronicle::runtime::config {
class RuntimeConfig;
}

namespace chronicle::observability {

/*
  OTLP export is driven by the observability block of RuntimeConfig. Both
  initializers return false and leave the no-op providers in place when
  their signal is disabled.
*/
bool InitializeTracing(const chronicle::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const chronicle::runtime::config::RuntimeConfig& config);
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

class Metrics {
 public:
  static Metrics& Instance();

  // chronicle.append.*
  void RecordAppend(std::string_view aggregate_type, bool success);
  void ObserveAppendLatencyMs(std::string_view aggregate_type, double latency_ms);

  // chronicle.projection.*
  void AddEventsProcessed(std::string_view projection, std::uint64_t count);
  void ObserveBatchDurationMs(std::string_view projection, double duration_ms);
  void RecordProjectionError(std::string_view projection);
  void SetProjectionLag(std::string_view projection, std::uint64_t lag);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const chronicle::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const chronicle::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordAppend(std::string_view, bool) {
}

inline void Metrics::ObserveAppendLatencyMs(std::string_view, double) {
}

inline void Metrics::AddEventsProcessed(std::string_view, std::uint64_t) {
}

inline void Metrics::ObserveBatchDurationMs(std::string_view, double) {
}

inline void Metrics::RecordProjectionError(std::string_view) {
}

inline void Metrics::SetProjectionLag(std::string_view, std::uint64_t) {
}
#endif

} // namespace chronicle::observability
