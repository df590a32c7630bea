#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "atomicswap_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::string& test_name, const std::string& yaml_content) {
  const auto yaml_path = WriteYaml(test_name, yaml_content);
  try {
    (void)atomicswap::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50071"
logging:
  level: debug
database:
  sqlite:
    path: "/tmp/atomicswap/swaps.db"
    wal_mode: true
swap:
  initiator_timelock: 24h
  acceptor_timelock: 12h
backends:
  - asset: BTC
    call_timeout: 10s
    retry:
      max_attempts: 5
      initial_backoff: 100ms
      max_backoff: 1s
    simulated:
      initial_balance: "10"
      latency: 0s
  - asset: depix
    simulated:
      initial_balance: "1000.5"
monitor:
  enabled: true
  interval: 30s
  cancel_expired_offers: true
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = atomicswap::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "/tmp/atomicswap/swaps.db");
  assert(config.swap().acceptor_timelock() == "12h");
  assert(config.backends_size() == 2);
  assert(config.backends(0).retry().max_attempts() == 5);
  assert(config.backends(0).simulated().initial_balance() == "10");
  assert(config.backends(1).simulated().initial_balance() == "1000.5");
  assert(config.monitor().cancel_expired_offers());
  assert(config.observability().transport() == atomicswap::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50071"
database:
  sqlite:
    path: "C:\\atomicswap\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = atomicswap::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\atomicswap\\\"quoted\"\\db.sqlite");
}

void TestUnknownFieldsAreRejected() {
  const bool threw = LoadThrows("unknown_field",
                                R"(server:
  bind_address: "0.0.0.0:50071"
unknown_field: 123
)");
  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestTimelockAsymmetryIsEnforced() {
  assert(LoadThrows("equal_timelocks",
                    R"(swap:
  initiator_timelock: 12h
  acceptor_timelock: 12h
)"));

  assert(LoadThrows("inverted_timelocks",
                    R"(swap:
  initiator_timelock: 1h
  acceptor_timelock: 2h
)"));

  // 1500ms and 1200ms truncate to the same stored second.
  assert(LoadThrows("subsecond_timelocks",
                    R"(swap:
  initiator_timelock: 1500ms
  acceptor_timelock: 1200ms
)"));

  assert(!LoadThrows("one_second_apart",
                     R"(swap:
  initiator_timelock: 2s
  acceptor_timelock: 1s
)"));

  // defaults: 24h / 12h
  assert(LoadThrows("acceptor_exceeds_default",
                    R"(swap:
  acceptor_timelock: 2d
)"));
}

void TestMalformedDurationIsRejected() {
  assert(LoadThrows("bad_duration",
                    R"(monitor:
  enabled: true
  interval: soon
)"));
}

void TestDuplicateBackendAssetsAreRejected() {
  assert(LoadThrows("duplicate_asset",
                    R"(backends:
  - asset: btc
    simulated:
      initial_balance: "1"
  - asset: BTC
    simulated:
      initial_balance: "2"
)"));
}

void TestBackendWithoutKindIsRejected() {
  assert(LoadThrows("no_kind",
                    R"(backends:
  - asset: btc
    call_timeout: 1s
)"));
}

} // namespace

int main() {
  TestFullConfigLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestTimelockAsymmetryIsEnforced();
  TestMalformedDurationIsRejected();
  TestDuplicateBackendAssetsAreRejected();
  TestBackendWithoutKindIsRejected();

  std::cout << "atomicswap_unit_config_loader: pass\n";
  return 0;
}
