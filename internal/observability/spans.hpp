#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace releasectl::runtime::config {
class RuntimeConfig;
}

namespace releasectl::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"release-controller"};
  std::string   service_version{"0.1.0"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint64_t metrics_interval_ms{1000};
  double        trace_sample_ratio{1.0};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const releasectl::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const releasectl::runtime::config::RuntimeConfig& config);
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

class Metrics {
 public:
  static Metrics& Instance();

  // action is one of "trigger", "delete", "sweep".
  void RecordReconcile(std::string_view action, bool success);
  void ObserveReconcileDurationMs(std::string_view action, double duration_ms);
  void RecordRequeue();
  void SetQueueDepth(std::uint64_t depth);

  void RecordRequest(std::string_view route, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const releasectl::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const releasectl::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordReconcile(std::string_view, bool) {
}

inline void Metrics::ObserveReconcileDurationMs(std::string_view, double) {
}

inline void Metrics::RecordRequeue() {
}

inline void Metrics::SetQueueDepth(std::uint64_t) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}
#endif

} // namespace releasectl::observability
