#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace releasectl::observability {
namespace {

using releasectl::runtime::config::LoggingConfig;

constexpr const char* kLoggerName  = "release-controller";
constexpr const char* kTextPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
constexpr const char* kJsonPattern = R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l",%v})";

bool g_json{false};
bool g_include_trace_context{false};

const char* EnvOrNull(const char* name) {
  const char* value = std::getenv(name);
  return value && *value ? value : nullptr;
}

bool EnvFlag(const char* name, bool fallback) {
  const char* value = EnvOrNull(name);
  if (!value) return fallback;
  const std::string flag(value);
  return flag == "1" || flag == "true";
}

bool UseJson(const LoggingConfig& logging) {
  if (const char* format = EnvOrNull("RELEASECTL_LOG_FORMAT")) {
    return std::string(format) == "json";
  }
  return logging.format() == releasectl::runtime::config::LOG_FORMAT_JSON;
}

std::string ResolveLevel(const LoggingConfig& logging) {
  if (const char* level = EnvOrNull("RELEASECTL_LOG_LEVEL")) return level;
  return logging.level().empty() ? "info" : logging.level();
}

std::string ResolvePattern(const LoggingConfig& logging) {
  if (g_json) return kJsonPattern;
  if (const char* pattern = EnvOrNull("RELEASECTL_LOG_PATTERN")) return pattern;
  return logging.pattern().empty() ? kTextPattern : logging.pattern();
}

// logfmt: bare when the value is a single token, quoted otherwise.
void AppendTextValue(std::string& out, const std::string& value) {
  const bool bare = !value.empty() && value.find_first_of(" =\"\\\n\t") == std::string::npos;
  if (bare) {
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

void AppendJsonString(std::string& out, std::string_view value) {
  out += '"';
  for (unsigned char c : value) {
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
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (c < 0x20) {
          char escaped[8];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x", c);
          out += escaped;
        } else {
          out += static_cast<char>(c);
        }
    }
  }
  out += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::vector<LogField>& fields) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  const auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  fields.push_back({"trace_id", HexId(trace_bytes, sizeof(trace_bytes))});
  fields.push_back({"span_id", HexId(span_bytes, sizeof(span_bytes))});
}
#else
void AppendTraceContext(std::vector<LogField>&) {
}
#endif

std::string RenderText(std::string_view message, const std::vector<LogField>& fields) {
  std::string out(message);
  for (const auto& field : fields) {
    out += ' ';
    out += field.key;
    out += '=';
    AppendTextValue(out, field.value);
  }
  return out;
}

std::string RenderJson(std::string_view message, const std::vector<LogField>& fields) {
  std::string out = "\"msg\":";
  AppendJsonString(out, message);
  for (const auto& field : fields) {
    out += ',';
    AppendJsonString(out, field.key);
    out += ':';
    AppendJsonString(out, field.value);
  }
  return out;
}

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

LogField DurationField(std::string_view key, std::chrono::nanoseconds value) {
  return {std::string(key), std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(value).count()) + "ms"};
}

void InitializeLogging(const releasectl::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  g_json                  = UseJson(logging);
  g_include_trace_context = EnvFlag("RELEASECTL_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context());

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!logging.file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logging.file()));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(ResolvePattern(logging));
  logger->set_level(spdlog::level::from_str(ResolveLevel(logging)));
  logger->flush_on(spdlog::level::warn);
  spdlog::register_logger(logger);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (!logger || !logger->should_log(level)) return;

  std::vector<LogField> all(fields);
  AppendTraceContext(all);

  logger->log(level, "{}", g_json ? RenderJson(message, all) : RenderText(message, all));
}

} // namespace releasectl::observability
