#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace {

using jobflow::config::ConfigLoader;
using jobflow::runtime::config::StoreConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "jobflow_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  include_trace_context: true
  file_path: "/tmp/jobflow/workflow/jobflow.log"
store:
  json:
    path: "/tmp/jobflow/workflow"
    fsync: true
  use_cache: true
content:
  root_path: "/tmp/jobflow/contents"
  fsync: false
  array_chunk_length: 1024
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().include_trace_context());
  assert(config.logging().file_path() == "/tmp/jobflow/workflow/jobflow.log");
  assert(config.store().backend_case() == StoreConfig::kJson);
  assert(config.store().json().path() == "/tmp/jobflow/workflow");
  assert(config.store().json().fsync());
  assert(config.store().use_cache());
  assert(config.content().root_path() == "/tmp/jobflow/contents");
  assert(config.content().array_chunk_length() == 1024);
  assert(config.observability().transport() == jobflow::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestLogSettingsFollowConfig() {
  auto config = ConfigLoader::LoadFromString(R"(logging:
  level: "warn"
  file_path: "/tmp/jobflow/run.log"
)");

  const auto settings = jobflow::observability::ResolveLogSettings(config);
  if (!std::getenv("JOBFLOW_LOG_LEVEL")) assert(settings.level == "warn");
  if (!std::getenv("JOBFLOW_LOG_FILE")) assert(settings.file_path == "/tmp/jobflow/run.log");
  assert(!settings.pattern.empty());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(store:
  sqlite:
    path: "C:\\jobflow\\\"quoted\"\\workflow.db"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().sqlite().path() == "C:\\jobflow\\\"quoted\"\\workflow.db");
}

void TestQuotedScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(store:
  json:
    path: "0755"
)");
  assert(config.store().json().path() == "0755");
}

void TestEmptyDocumentIsAllDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.store().backend_case() == StoreConfig::BACKEND_NOT_SET);
  assert(config.content().root_path().empty());
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(store:
  memory: {}
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestSelectedBackendNeedsAPath() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString(R"(store:
  sqlite:
    path: ""
)");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "an sqlite store without a path must be rejected");
}

void TestRelativePathsFollowTheConfigFile() {
  const auto yaml_path = WriteYaml("relative_paths",
                                   R"(logging:
  file_path: "logs/jobflow.log"
store:
  sqlite:
    path: "workflow.db"
content:
  root_path: "/abs/contents"
)");

  const auto base   = std::filesystem::absolute(yaml_path).parent_path();
  auto       config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().sqlite().path() == (base / "workflow.db").string());
  assert(config.logging().file_path() == (base / "logs" / "jobflow.log").string());
  assert(config.content().root_path() == "/abs/contents");

  // strings carry no file to be relative to
  auto from_string = ConfigLoader::LoadFromString(R"(store:
  sqlite:
    path: "workflow.db"
)");
  assert(from_string.store().sqlite().path() == "workflow.db");
}

void TestOutOfRangeSettingsAreRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromString(R"(logging:
  level: "chatty"
)");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ConfigLoader::LoadFromString("content:\n  array_chunk_length: -1\n");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  auto config = ConfigLoader::LoadFromString("logging:\n  level: warn\n");
  assert(config.logging().level() == "warn");
}

} // namespace

int main() {
  TestFullConfig();
  TestLogSettingsFollowConfig();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedScalarsStayStrings();
  TestEmptyDocumentIsAllDefaults();
  TestUnknownFieldsAreRejected();
  TestSelectedBackendNeedsAPath();
  TestRelativePathsFollowTheConfigFile();
  TestOutOfRangeSettingsAreRejected();

  std::cout << "jobflow_unit_config_loader: pass\n";
  return 0;
}
