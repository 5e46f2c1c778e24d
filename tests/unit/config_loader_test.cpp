#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using rvault::config::ConfigLoader;
using rvault::runtime::config::AccountSourceConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "rvault_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigIsParsed() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
logging:
  level: debug
program:
  program_id: "2SBFs9cnkv6NZjM28a87ysPr7zvPWj7KuQC4WW16nGS7"
  partners:
    - "8b1sr6ZyBY68DvwZmfTBVu4b9Lyi9PthB9LU3PH2PBhF:Ally"
  max_stale_secs: 120
  commitment: COMMITMENT_FINALIZED
accounts:
  fixture:
    path: "/tmp/accounts.yaml"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.logging().level() == "debug");
  assert(config.program().program_id() == "2SBFs9cnkv6NZjM28a87ysPr7zvPWj7KuQC4WW16nGS7");
  assert(config.program().partners_size() == 1);
  assert(config.program().max_stale_secs() == 120);
  assert(config.program().commitment() == rvault::runtime::config::COMMITMENT_FINALIZED);
  assert(config.accounts().source_case() == AccountSourceConfig::kFixture);
  assert(config.accounts().fixture().path() == "/tmp/accounts.yaml");
}

void TestDefaultsAreApplied() {
  const auto config = ConfigLoader::LoadFromString("program:\n  program_id: \"abc\"\n");
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.program().max_stale_secs() == 60);
  assert(config.program().commitment() == rvault::runtime::config::COMMITMENT_CONFIRMED);
  assert(config.accounts().source_case() == AccountSourceConfig::kMemory);
}

void TestQuotedDigitsStayStrings() {
  // Every character of this address is a digit; unquoted it would become a number.
  const auto config = ConfigLoader::LoadFromString(R"(program:
  fallback_price_feed: "11111111111111111111111111111111"
  pool_base_reserve: "123456789"
)");
  assert(config.program().fallback_price_feed() == "11111111111111111111111111111111");
  assert(config.program().pool_base_reserve() == "123456789");
}

void TestScalarEscaping() {
  const auto config = ConfigLoader::LoadFromString(R"(server:
  bind_address: "line1\nline2☃"
accounts:
  fixture:
    path: "C:\\vault\\\"quoted\"\\accounts.yaml"
)");
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
  assert(config.accounts().fixture().path() == "C:\\vault\\\"quoted\"\\accounts.yaml");
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

void TestUnreadableInputThrows() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/rvault/config.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ConfigLoader::LoadFromString("server: [\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsParsed();
  TestDefaultsAreApplied();
  TestQuotedDigitsStayStrings();
  TestScalarEscaping();
  TestUnknownFieldsAreRejected();
  TestUnreadableInputThrows();

  std::cout << "rvault_unit_config_loader: pass\n";
  return 0;
}
