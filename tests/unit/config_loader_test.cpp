#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using brewmon::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "brewmon_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParses() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:50070"
database:
  sqlite:
    path: "/var/lib/brewmon/deliveries.db"
machine:
  register_file:
    path: "/run/brewmon/registers.map"
    max_age_ms: 10000
  group_count: 2
monitor:
  poll_interval_ms: 2500
  start_enabled: true
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:50070");
  assert(config.database().sqlite().path() == "/var/lib/brewmon/deliveries.db");
  assert(config.machine().register_file().path() == "/run/brewmon/registers.map");
  assert(config.machine().register_file().max_age_ms() == 10000);
  assert(config.machine().group_count() == 2);
  assert(config.monitor().poll_interval_ms() == 2500);
  assert(config.monitor().start_enabled());
  assert(config.logging().level() == "debug");
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.server().bind_address() == ConfigLoader::kDefaultBindAddress);
  assert(config.database().has_memory());
  assert(config.machine().has_simulated());
  assert(config.monitor().poll_interval_ms() == ConfigLoader::kDefaultPollIntervalMs);
  assert(!config.monitor().start_enabled());
  assert(config.logging().level() == "info");
}

void TestSimulatedStatusWords() {
  auto config = ConfigLoader::LoadFromString(R"(machine:
  simulated:
    initial_status_words: [0, 8, 64]
)");
  assert(config.machine().simulated().initial_status_words_size() == 3);
  assert(config.machine().simulated().initial_status_words(1) == 8);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\brewmon\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\brewmon\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumberStaysString() {
  auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "50061"
)");
  assert(config.server().bind_address() == "50061");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
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

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "brewmon_no_such_config.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRangeChecks() {
  auto expect_invalid = [](const std::string& yaml) {
    auto config = ConfigLoader::LoadFromString(yaml);
    bool threw  = false;
    try {
      brewmon::factory::ValidateConfig(config);
    } catch (const brewmon::util::InvalidArgument&) {
      threw = true;
    }
    assert(threw);
  };

  expect_invalid("monitor:\n  poll_interval_ms: 100\n");
  expect_invalid("monitor:\n  poll_interval_ms: 120000\n");
  expect_invalid("machine:\n  group_count: 6\n");
  expect_invalid("machine:\n  simulated:\n    initial_status_words: [70000]\n");
  expect_invalid("machine:\n  register_file:\n    max_age_ms: 10\n");
  expect_invalid("database:\n  sqlite:\n    path: \"\"\n");

  brewmon::factory::ValidateConfig(ConfigLoader::LoadFromString("monitor:\n  poll_interval_ms: 3000\n"));
}

} // namespace

int main() {
  TestFullConfigParses();
  TestEmptyDocumentGetsDefaults();
  TestSimulatedStatusWords();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumberStaysString();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestRangeChecks();

  std::cout << "brewmon_unit_config_loader: pass\n";
  return 0;
}
