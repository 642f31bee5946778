#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace releasectl::config {

using releasectl::runtime::config::RuntimeConfig;

namespace {

// Plain scalars are typed the way YAML 1.2 core schema reads them; quoted
// scalars always stay strings so "8080" or "true" survive as text.
void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "True" || text == "TRUE") {
    value->set_bool_value(true);
    return;
  }
  if (text == "false" || text == "False" || text == "FALSE") {
    value->set_bool_value(false);
    return;
  }
  if (text == "~" || text == "null" || text == "Null" || text == "NULL") {
    value->set_null_value(google::protobuf::NULL_VALUE);
    return;
  }

  // Integers go through as strings: protobuf JSON accepts quoted 64-bit
  // integers, and a double would round anything above 2^53.
  std::int64_t integer = 0;
  const auto*  end     = text.data() + text.size();
  if (auto [ptr, ec] = std::from_chars(text.data(), end, integer); ec == std::errc{} && ptr == end) {
    value->set_string_value(text);
    return;
  }

  char*        parsed_end = nullptr;
  const double number     = std::strtod(text.c_str(), &parsed_end);
  if (!text.empty() && parsed_end == text.c_str() + text.size()) {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(text);
}

void YamlToValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToValue(entry.second, &(*fields)[entry.first.as<std::string>()]);
      }
      return;
    }
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) {
    // An empty document is a config with every tunable defaulted.
    ConfigLoader::ApplyDefaults(&config);
    ConfigLoader::Validate(config);
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value value;
  YamlToValue(yaml, &value);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(value, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(&config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::BadFile&) {
    throw std::runtime_error("Failed to load YAML config: can't open " + path);
  } catch (const YAML::ParserException& e) {
    throw std::runtime_error("Failed to load YAML config " + path + " at line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::ParserException& e) {
    throw std::runtime_error("Failed to parse YAML config at line " + std::to_string(e.mark.line + 1) + ": " + e.msg);
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* server = config->mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:50061");

  auto* controller = config->mutable_controller();
  if (controller->workers() == 0) controller->set_workers(1);
  if (controller->worker_period_ms() == 0) controller->set_worker_period_ms(1000);
  if (controller->cache_sync_poll_ms() == 0) controller->set_cache_sync_poll_ms(100);

  auto* limiter = controller->mutable_rate_limiter();
  if (limiter->base_delay_ms() == 0) limiter->set_base_delay_ms(5);
  if (limiter->max_delay_ms() == 0) limiter->set_max_delay_ms(1000 * 1000);
  if (limiter->qps() <= 0.0) limiter->set_qps(10.0);
  if (limiter->burst() == 0) limiter->set_burst(100);

  auto* source = config->mutable_source();
  if (source->poll_interval_ms() == 0) source->set_poll_interval_ms(1000);

  auto* observability = config->mutable_observability();
  if (observability->metrics_interval_ms() == 0) observability->set_metrics_interval_ms(1000);
  if (observability->trace_sample_ratio() <= 0.0) observability->set_trace_sample_ratio(1.0);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& limiter = config.controller().rate_limiter();
  if (limiter.max_delay_ms() < limiter.base_delay_ms()) {
    throw std::invalid_argument("controller.rate_limiter.max_delay_ms must not be below base_delay_ms");
  }
  if (config.controller().workers() > 256) {
    throw std::invalid_argument("controller.workers must be at most 256");
  }
  if (config.observability().trace_sample_ratio() > 1.0) {
    throw std::invalid_argument("observability.trace_sample_ratio must be in (0, 1]");
  }
}

} // namespace releasectl::config
