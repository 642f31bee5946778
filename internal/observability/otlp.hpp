#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

#include "internal/observability/spans.hpp"

namespace releasectl::observability::detail {

enum class Signal {
  kTraces,
  kMetrics,
};

// Explicit endpoint, then the per-signal OTEL env var, then the shared one.
// For HTTP the shared endpoint is a base URL and gets the signal path appended.
std::string ResolveEndpoint(const OtlpConfig& config, Signal signal);

opentelemetry::sdk::resource::Resource BuildResource(const OtlpConfig& config);

OtlpConfig FromRuntimeConfig(const releasectl::runtime::config::RuntimeConfig& config);

} // namespace releasectl::observability::detail

#endif
