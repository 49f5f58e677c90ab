#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using relay::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relaycore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestEmptyDocumentYieldsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.storage().prefix() == "wc@2:client:");
  assert(config.storage().has_memory());
  assert(config.heartbeat().interval().seconds() == 5);
  assert(config.publisher().default_ttl().seconds() == 86400);
  assert(config.publisher().relay_protocol() == "irn");
}

void TestFullDocumentFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  pattern: "[%l] %v"
storage:
  prefix: "app@1:client:"
  sqlite:
    path: "/tmp/relaycore/\"quoted\".sqlite"
    wal_mode: true
heartbeat:
  interval: "0.5s"
publisher:
  default_ttl: "300s"
  relay_protocol: "waku"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.storage().prefix() == "app@1:client:");
  assert(config.storage().has_sqlite());
  assert(config.storage().sqlite().path() == "/tmp/relaycore/\"quoted\".sqlite");
  assert(config.storage().sqlite().wal_mode());
  assert(config.heartbeat().interval().seconds() == 0);
  assert(config.heartbeat().interval().nanos() == 500000000);
  assert(config.publisher().default_ttl().seconds() == 300);
  assert(config.publisher().relay_protocol() == "waku");
}

void TestMemorySectionSelectsMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString(R"(storage:
  memory: {}
)");
  assert(config.storage().has_memory());
  assert(!config.storage().has_sqlite());
}

void TestUnknownFieldsAreRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(storage:
  prefix: "x:"
unknown_field: 123
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptySqlitePathIsRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(storage:
  sqlite:
    wal_mode: true
)");
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestZeroHeartbeatIntervalIsRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(heartbeat:
  interval: "0s"
)");
  } catch (const relay::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSubMillisecondHeartbeatIntervalIsRejected() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYamlString(R"(heartbeat:
  interval: "0.0005s"
)");
  } catch (const relay::util::InvalidArgument& e) {
    threw = std::string(e.what()) == "heartbeat.interval must be at least 1ms";
  }
  assert(threw);

  auto config = ConfigLoader::LoadFromYamlString(R"(heartbeat:
  interval: "0.001s"
)");
  assert(config.heartbeat().interval().nanos() == 1000000);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/relaycore/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentYieldsDefaults();
  TestFullDocumentFromFile();
  TestMemorySectionSelectsMemoryBackend();
  TestUnknownFieldsAreRejected();
  TestEmptySqlitePathIsRejected();
  TestZeroHeartbeatIntervalIsRejected();
  TestSubMillisecondHeartbeatIntervalIsRejected();
  TestMissingFileIsReported();

  std::cout << "relaycore_unit_config_loader: pass\n";
  return 0;
}
