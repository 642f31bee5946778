#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "releasectl_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
logging:
  level: debug
controller:
  workers: 4
  worker_period_ms: 250
  cache_sync_poll_ms: 20
  periodic_sweep: true
  rate_limiter:
    base_delay_ms: 10
    max_delay_ms: 60000
    qps: 2.5
    burst: 7
source:
  manifest_dir: "/etc/releases"
  poll_interval_ms: 500
)");

  auto config = releasectl::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.logging().level() == "debug");
  assert(config.controller().workers() == 4);
  assert(config.controller().worker_period_ms() == 250);
  assert(config.controller().cache_sync_poll_ms() == 20);
  assert(config.controller().periodic_sweep());
  assert(config.controller().rate_limiter().base_delay_ms() == 10);
  assert(config.controller().rate_limiter().max_delay_ms() == 60000);
  assert(config.controller().rate_limiter().qps() == 2.5);
  assert(config.controller().rate_limiter().burst() == 7);
  assert(config.source().manifest_dir() == "/etc/releases");
  assert(config.source().poll_interval_ms() == 500);
}

void TestUnsetTunablesTakeDefaults() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(source:
  manifest_dir: "/tmp/releases"
)");

  auto config = releasectl::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.controller().workers() == 1);
  assert(config.controller().worker_period_ms() == 1000);
  assert(config.controller().cache_sync_poll_ms() == 100);
  assert(!config.controller().periodic_sweep());
  assert(config.controller().rate_limiter().base_delay_ms() == 5);
  assert(config.controller().rate_limiter().max_delay_ms() == 1000000);
  assert(config.controller().rate_limiter().qps() == 10.0);
  assert(config.controller().rate_limiter().burst() == 100);
  assert(config.source().poll_interval_ms() == 1000);
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = releasectl::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)releasectl::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)releasectl::config::ConfigLoader::LoadFromYaml("/nonexistent/releasectl/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestQuotedScalarsStayStrings() {
  auto config = releasectl::config::ConfigLoader::LoadFromString(R"(logging:
  level: "1"
  pattern: 'true'
controller:
  rate_limiter:
    max_delay_ms: 9007199254740993
)");
  assert(config.logging().level() == "1");
  assert(config.logging().pattern() == "true");
  assert(config.controller().rate_limiter().max_delay_ms() == 9007199254740993ULL);
}

void TestObservabilityAndLoggingOptions() {
  auto config = releasectl::config::ConfigLoader::LoadFromString(R"(logging:
  format: LOG_FORMAT_JSON
  file: /var/log/release-controller.log
observability:
  tracing_enabled: true
  transport: OTLP_TRANSPORT_HTTP
  trace_sample_ratio: 0.25
)");
  assert(config.logging().format() == releasectl::runtime::config::LOG_FORMAT_JSON);
  assert(config.logging().file() == "/var/log/release-controller.log");
  assert(config.observability().tracing_enabled());
  assert(config.observability().transport() == releasectl::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().trace_sample_ratio() == 0.25);
  assert(config.observability().metrics_interval_ms() == 1000);
}

void TestEmptyDocumentTakesDefaults() {
  auto config = releasectl::config::ConfigLoader::LoadFromString("");
  assert(config.controller().workers() == 1);
  assert(config.observability().trace_sample_ratio() == 1.0);
}

void TestOutOfRangeValuesAreRejected() {
  bool threw = false;
  try {
    (void)releasectl::config::ConfigLoader::LoadFromString(R"(controller:
  rate_limiter:
    base_delay_ms: 500
    max_delay_ms: 100
)");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestParseErrorNamesLine() {
  try {
    (void)releasectl::config::ConfigLoader::LoadFromString("server:\n  bind_address: [unterminated\n");
    assert(false && "malformed YAML must throw");
  } catch (const std::runtime_error& e) {
    assert(std::string(e.what()).find("line") != std::string::npos);
  }
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestUnsetTunablesTakeDefaults();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestQuotedScalarsStayStrings();
  TestObservabilityAndLoggingOptions();
  TestEmptyDocumentTakesDefaults();
  TestOutOfRangeValuesAreRejected();
  TestParseErrorNamesLine();

  std::cout << "releasectl_unit_config_loader: pass\n";
  return 0;
}
