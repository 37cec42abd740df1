#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace jobsrv::runtime::config {
class RuntimeConfig;
}

namespace jobsrv::observability {

#ifdef ENABLE_OTEL
// Collector address for one signal: config, then the signal's OTEL_* variable,
// then OTEL_EXPORTER_OTLP_ENDPOINT, then localhost:4317.
std::string OtlpEndpoint(const jobsrv::runtime::config::RuntimeConfig& config, const char* signal_env);
std::string ServiceName(const jobsrv::runtime::config::RuntimeConfig& config);
#endif

bool InitializeTracing(const jobsrv::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const jobsrv::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments.

  route        = service operation (SubmitGroup, ReportJob, ...)
  state        = job state a transition moved into
  outcome      = dispatch result (sent, send_failed, superseded)
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordJobTransition(std::string_view state, std::uint64_t count = 1);
  void RecordDispatch(std::string_view outcome);
  void SetLiveWorkers(std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const jobsrv::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const jobsrv::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordJobTransition(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordDispatch(std::string_view) {
}

inline void Metrics::SetLiveWorkers(std::int64_t) {
}
#endif

} // namespace jobsrv::observability
