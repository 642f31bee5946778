#include "internal/observability/otlp.hpp"

#ifdef ENABLE_OTEL

#include <unistd.h>

#include <algorithm>
#include <cstdlib>

#include "config/config.pb.h"

namespace releasectl::observability::detail {
namespace resource = opentelemetry::sdk::resource;

namespace {

const char* SignalEnv(Signal signal) {
  return signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

const char* SignalPath(Signal signal) {
  return signal == Signal::kTraces ? "/v1/traces" : "/v1/metrics";
}

std::string HostName() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

} // namespace

std::string ResolveEndpoint(const OtlpConfig& config, Signal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv(SignalEnv(signal)); endpoint && *endpoint) {
    return endpoint;
  }

  const bool http = config.transport == OtlpTransport::kHttpProtobuf;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); endpoint && *endpoint) {
    return http ? std::string(endpoint) + SignalPath(signal) : std::string(endpoint);
  }

  return http ? std::string("http://localhost:4318") + SignalPath(signal) : std::string("localhost:4317");
}

resource::Resource BuildResource(const OtlpConfig& config) {
  const auto                   instance = HostName();
  resource::ResourceAttributes attrs    = {
      {"service.name", config.service_name},
      {"service.version", config.service_version},
      {"service.instance.id", instance},
  };
  return resource::Resource::Create(attrs);
}

OtlpConfig FromRuntimeConfig(const releasectl::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig out;
  if (!observability.service_name().empty()) {
    out.service_name = observability.service_name();
  }
  out.endpoint = observability.otlp_endpoint();
  out.transport =
      observability.transport() == releasectl::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  out.insecure = !observability.use_tls();
  if (observability.metrics_interval_ms() > 0) {
    out.metrics_interval_ms = observability.metrics_interval_ms();
  }
  if (observability.trace_sample_ratio() > 0.0) {
    out.trace_sample_ratio = std::min(observability.trace_sample_ratio(), 1.0);
  }
  return out;
}

} // namespace releasectl::observability::detail

#endif
