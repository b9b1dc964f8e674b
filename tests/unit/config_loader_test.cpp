#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using linecheck::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "linecheck_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadFails(const std::string& test_name, const std::string& yaml_content) {
  try {
    (void)ConfigLoader::LoadFromYaml(WriteYaml(test_name, yaml_content).string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("empty", "").string());
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(config.database().has_memory());
  assert(config.line().name() == "Line 1");
  assert(config.line().supervisor_pin() == "1234");
  assert(config.line().max_pin_attempts() == 5);
  assert(config.line().pin_lockout_seconds() == 900);
  assert(config.line().recent_scan_window() == 8);
  assert(config.line().report_first_hour() == 8);
  assert(config.line().report_last_hour() == 20);
  assert(config.broadcast().subscriber_queue_capacity() == 50);
  assert(config.hardware().mode() == "simulated");
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "C:\\line\\\"quoted\"\\db.sqlite"
    wal_mode: false
line:
  name: "Packing 3"
  supervisor_pin: "0042"
  max_pin_attempts: 3
  pin_lockout_seconds: 60
  report_first_hour: 0
  report_last_hour: 23
broadcast:
  subscriber_queue_capacity: 10
hardware:
  mode: disabled
admin:
  token: "s3cret"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().sqlite().path() == "C:\\line\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().has_wal_mode() && !config.database().sqlite().wal_mode());
  assert(config.database().sqlite().synchronous() == "full");
  // quoted digits stay a string
  assert(config.line().supervisor_pin() == "0042");
  assert(config.line().name() == "Packing 3");
  assert(config.line().max_pin_attempts() == 3);
  assert(config.line().report_first_hour() == 0);
  assert(config.line().report_last_hour() == 23);
  assert(config.broadcast().subscriber_queue_capacity() == 10);
  assert(config.hardware().mode() == "disabled");
  assert(config.admin().token() == "s3cret");
}

void TestEnvironmentOverridesPin() {
  setenv("LINECHECK_SUPERVISOR_PIN", "9876", 1);
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("env_pin", "line:\n  supervisor_pin: \"1111\"\n").string());
  unsetenv("LINECHECK_SUPERVISOR_PIN");
  assert(config.line().supervisor_pin() == "9876");
}

void TestInvalidSettingsAreRejected() {
  assert(LoadFails("unknown_field", "server:\n  bind_address: \"0.0.0.0:1\"\nunknown_field: 123\n"));
  assert(LoadFails("short_pin", "line:\n  supervisor_pin: \"12\"\n"));
  assert(LoadFails("symbol_pin", "line:\n  supervisor_pin: \"12-34\"\n"));
  assert(LoadFails("hours", "line:\n  report_first_hour: 18\n  report_last_hour: 6\n"));
  assert(LoadFails("hour_range", "line:\n  report_last_hour: 24\n"));
  assert(LoadFails("sqlite_path", "database:\n  sqlite:\n    wal_mode: true\n"));
  assert(LoadFails("sqlite_sync", "database:\n  sqlite:\n    path: \"/tmp/x.db\"\n    synchronous: \"off\"\n"));
  assert(LoadFails("postgres_uri", "database:\n  postgres:\n    max_connections: 2\n"));
  assert(LoadFails("hardware_mode", "hardware:\n  mode: gpio\n"));
  assert(LoadFails("pin_attempts", "line:\n  max_pin_attempts: 101\n"));
  assert(LoadFails("pin_lockout", "line:\n  pin_lockout_seconds: 86401\n"));
  assert(LoadFails("queue_capacity", "broadcast:\n  subscriber_queue_capacity: 10001\n"));
}

void TestUpperBoundsAreInclusive() {
  auto config = ConfigLoader::LoadFromYaml(WriteYaml("upper_bounds",
                                                     "line:\n  max_pin_attempts: 100\n  pin_lockout_seconds: 86400\n  recent_scan_window: 100\n"
                                                     "broadcast:\n  subscriber_queue_capacity: 10000\n")
                                               .string());
  assert(config.line().max_pin_attempts() == 100);
  assert(config.line().pin_lockout_seconds() == 86400);
  assert(config.broadcast().subscriber_queue_capacity() == 10000);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/linecheck.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  unsetenv("LINECHECK_SUPERVISOR_PIN");

  TestEmptyDocumentGetsDefaults();
  TestFullConfig();
  TestEnvironmentOverridesPin();
  TestInvalidSettingsAreRejected();
  TestUpperBoundsAreInclusive();
  TestMissingFileIsReported();

  std::cout << "linecheck_unit_config_loader: pass\n";
  return 0;
}
